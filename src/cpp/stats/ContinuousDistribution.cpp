/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "statdist/stats/ContinuousDistribution.hpp"

#include "argument_utils.hpp"
#include "common.hpp"
#include "logging.hpp"
#include "statdist/numerics/SpecialFunctions.hpp"

#include <boost/math/special_functions/next.hpp>
#include <boost/math/tools/toms748_solve.hpp>

//-------------------------------------------------------------------------

namespace statdist::stats
{

//-------------------------------------------------------------------------

namespace
{

constexpr double kSolverRelativeAccuracy = 1e-14;
constexpr double kSolverAbsoluteAccuracy = 1e-9;
constexpr std::uintmax_t kSolverMaxIterations = 256;

//-------------------------------------------------------------------------

// Root of a monotone fn bracketed by [lower, upper], both finite.
template<typename Fn>
[[nodiscard]] double solveBracketed(Fn fn, double lower, double upper)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    const double fLower = fn(lower);
    if (fLower == 0.0) {
        return lower;
    }
    const double fUpper = fn(upper);
    if (fUpper == 0.0) {
        return upper;
    }
    // Rounding in the bracket estimate can leave both ends on one side of the root.
    if ((fLower < 0.0) == (fUpper < 0.0)) {
        return std::abs(fLower) <= std::abs(fUpper) ? lower : upper;
    }

    const auto tolerance = [](double a, double b) {
        return std::abs(b - a)
            <= kSolverRelativeAccuracy * std::max(std::abs(a), std::abs(b))
                + kSolverAbsoluteAccuracy;
    };

    std::uintmax_t iterations = kSolverMaxIterations;
    const auto [a, b] = boost::math::tools::toms748_solve(
        fn, lower, upper, fLower, fUpper, tolerance, iterations, numerics::Policy{});

    if (iterations >= kSolverMaxIterations) {
        log::logger().warn(
            "{}: no convergence after {} iterations, bracket [{}, {}]", ctx, iterations, a, b);
    }

    return a + 0.5 * (b - a);
}

}  // namespace

//-------------------------------------------------------------------------

double ContinuousDistribution::logDensity(double x) const
{
    return std::log(density(x));
}

//-------------------------------------------------------------------------

double ContinuousDistribution::survivalProbability(double x) const
{
    return 1.0 - cumulativeProbability(x);
}

//-------------------------------------------------------------------------

double ContinuousDistribution::probability(double x0, double x1) const
{
    if (x0 > x1) {
        throw DistributionException::invalidRange(x0, x1);
    }
    if (x0 >= median()) {
        return survivalProbability(x0) - survivalProbability(x1);
    }
    return cumulativeProbability(x1) - cumulativeProbability(x0);
}

//-------------------------------------------------------------------------

double ContinuousDistribution::inverseCumulativeProbability(double p) const
{
    checkProbability(p);
    return inverseProbability(p, 1.0 - p, false);
}

//-------------------------------------------------------------------------

double ContinuousDistribution::inverseSurvivalProbability(double p) const
{
    checkProbability(p);
    return inverseProbability(1.0 - p, p, true);
}

//-------------------------------------------------------------------------

std::unique_ptr<ContinuousSampler> ContinuousDistribution::createSampler(
    std::mt19937& rng) const
{
    return makeSampler<double>(
        [this, &rng, uniform = std::uniform_real_distribution<double>{}]() mutable {
            return inverseCumulativeProbability(uniform(rng));
        });
}

//-------------------------------------------------------------------------

double ContinuousDistribution::median() const
{
    return inverseCumulativeProbability(0.5);
}

//-------------------------------------------------------------------------

double ContinuousDistribution::inverseProbability(double p, double q, bool complement) const
{
    double lowerBound = supportLowerBound();
    if (p == 0.0) {
        return lowerBound;
    }
    double upperBound = supportUpperBound();
    if (q == 0.0) {
        return upperBound;
    }

    const double mu = mean();
    const double sigma = std::sqrt(variance());
    const bool chebyshevApplies = std::isfinite(mu) && isFiniteStrictlyPositive(sigma);

    if (lowerBound == -kInf) {
        lowerBound = finiteLowerBound(p, q, complement, upperBound, mu, sigma, chebyshevApplies);
    }
    if (upperBound == kInf) {
        upperBound = finiteUpperBound(p, q, complement, lowerBound, mu, sigma, chebyshevApplies);
    }

    // A clamped bracket truncates the support and may not contain the target.
    if (upperBound == kMaxDouble) {
        if (complement ? survivalProbability(upperBound) > q
                       : cumulativeProbability(upperBound) < p) {
            return supportUpperBound();
        }
    }
    if (lowerBound == -kMaxDouble) {
        if (complement ? survivalProbability(lowerBound) < q
                       : cumulativeProbability(lowerBound) > p) {
            return supportLowerBound();
        }
    }

    const double x = complement
        ? solveBracketed(
            [this, q](double arg) { return survivalProbability(arg) - q; },
            lowerBound, upperBound)
        : solveBracketed(
            [this, p](double arg) { return cumulativeProbability(arg) - p; },
            lowerBound, upperBound);

    if (!isSupportConnected()) {
        return searchPlateau(complement, lowerBound, x);
    }
    return x;
}

//-------------------------------------------------------------------------

double ContinuousDistribution::finiteLowerBound(
    double p,
    double q,
    bool complement,
    double upperBound,
    double mu,
    double sigma,
    bool chebyshevApplies) const
{
    // One-sided Chebyshev: P(X <= mu - sigma * sqrt(q / p)) <= p
    double lowerBound = chebyshevApplies ? mu - sigma * std::sqrt(q / p) : -kInf;

    if (lowerBound == -kInf) {
        lowerBound = std::min(-1.0, upperBound);
        if (complement) {
            while (survivalProbability(lowerBound) < q) {
                lowerBound *= 2;
            }
        }
        else {
            while (cumulativeProbability(lowerBound) >= p) {
                lowerBound *= 2;
            }
        }
        lowerBound = std::max(lowerBound, -kMaxDouble);
    }
    return lowerBound;
}

//-------------------------------------------------------------------------

double ContinuousDistribution::finiteUpperBound(
    double p,
    double q,
    bool complement,
    double lowerBound,
    double mu,
    double sigma,
    bool chebyshevApplies) const
{
    double upperBound = chebyshevApplies ? mu + sigma * std::sqrt(p / q) : kInf;

    if (upperBound == kInf) {
        upperBound = std::max(1.0, lowerBound);
        if (complement) {
            while (survivalProbability(upperBound) >= q) {
                upperBound *= 2;
            }
        }
        else {
            while (cumulativeProbability(upperBound) < p) {
                upperBound *= 2;
            }
        }
        upperBound = std::min(upperBound, kMaxDouble);
    }
    return upperBound;
}

//-------------------------------------------------------------------------

double ContinuousDistribution::searchPlateau(bool complement, double lower, double x) const
{
    // Step at least one ulp so a solver result finer than the absolute accuracy terminates.
    const double dx = std::max(kSolverAbsoluteAccuracy, boost::math::ulp(x, numerics::Policy{}));
    if (x - dx < lower) {
        return x;
    }

    const auto fn = [this, complement](double arg) {
        return complement ? survivalProbability(arg) : cumulativeProbability(arg);
    };
    const double px = fn(x);
    if (fn(x - dx) != px) {
        return x;
    }

    // Move the lower bound up while the function is strictly on the near side of px.
    const auto belowPlateau = [complement](double value, double target) {
        return complement ? value > target : value < target;
    };

    double lowerBound = lower;
    double upperBound = x;
    while (upperBound - lowerBound > dx) {
        const double midPoint = 0.5 * (lowerBound + upperBound);
        if (belowPlateau(fn(midPoint), px)) {
            lowerBound = midPoint;
        }
        else {
            upperBound = midPoint;
        }
    }
    return upperBound;
}

//-------------------------------------------------------------------------

}  // namespace statdist::stats

//-------------------------------------------------------------------------
