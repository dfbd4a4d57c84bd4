/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "statdist/stats/DiscreteDistribution.hpp"

#include "argument_utils.hpp"
#include "common.hpp"

//-------------------------------------------------------------------------

namespace statdist::stats
{

//-------------------------------------------------------------------------

namespace
{

[[nodiscard]] double checkedProbability(double value)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (std::isnan(value)) {
        throw std::runtime_error{fmt::format("{}: CDF evaluated to NaN", ctx)};
    }
    return value;
}

//-------------------------------------------------------------------------

// Smallest x in (lower, upper] with fn(x) true, given fn(upper) is true.
template<typename Fn>
[[nodiscard]] int32_t bisect(Fn fn, int64_t lower, int64_t upper)
{
    while (lower + 1 < upper) {
        const int64_t middle = (lower + upper) / 2;
        if (fn(static_cast<int32_t>(middle))) {
            upper = middle;
        }
        else {
            lower = middle;
        }
    }
    return static_cast<int32_t>(upper);
}

}  // namespace

//-------------------------------------------------------------------------

double DiscreteDistribution::logProbability(int32_t x) const
{
    return std::log(probability(x));
}

//-------------------------------------------------------------------------

double DiscreteDistribution::survivalProbability(int32_t x) const
{
    return 1.0 - cumulativeProbability(x);
}

//-------------------------------------------------------------------------

double DiscreteDistribution::probability(int32_t x0, int32_t x1) const
{
    if (x0 > x1) {
        throw DistributionException::invalidRange(x0, x1);
    }
    if (int64_t{x0} + 1 >= x1) {
        return x0 == x1 ? 0.0 : probability(x1);
    }
    if (x0 >= median()) {
        return survivalProbability(x0) - survivalProbability(x1);
    }
    return cumulativeProbability(x1) - cumulativeProbability(x0);
}

//-------------------------------------------------------------------------

int32_t DiscreteDistribution::inverseCumulativeProbability(double p) const
{
    checkProbability(p);
    return inverseProbability(p, 1.0 - p, false);
}

//-------------------------------------------------------------------------

int32_t DiscreteDistribution::inverseSurvivalProbability(double p) const
{
    checkProbability(p);
    return inverseProbability(1.0 - p, p, true);
}

//-------------------------------------------------------------------------

std::unique_ptr<DiscreteSampler> DiscreteDistribution::createSampler(std::mt19937& rng) const
{
    return makeSampler<int32_t>(
        [this, &rng, uniform = std::uniform_real_distribution<double>{}]() mutable {
            return inverseCumulativeProbability(uniform(rng));
        });
}

//-------------------------------------------------------------------------

int32_t DiscreteDistribution::median() const
{
    return inverseCumulativeProbability(0.5);
}

//-------------------------------------------------------------------------

int32_t DiscreteDistribution::inverseProbability(double p, double q, bool complement) const
{
    int64_t lower = supportLowerBound();
    if (p == 0.0) {
        return static_cast<int32_t>(lower);
    }
    int64_t upper = supportUpperBound();
    if (q == 0.0) {
        return static_cast<int32_t>(upper);
    }

    // True where the upper end of the search can be lowered to x.
    const auto reached = [this, p, q, complement](int32_t x) {
        return complement ? checkedProbability(survivalProbability(x)) <= q
                          : checkedProbability(cumulativeProbability(x)) >= p;
    };

    if (lower == kMinInt) {
        if (reached(kMinInt)) {
            return kMinInt;
        }
    }
    else {
        // The search interval is open at the lower end.
        lower -= 1;
    }

    // Narrow the bracket with the one-sided Chebyshev inequality. Estimates outside
    // (lower, upper) leave the bracket as is.
    const auto inBracket = [&lower, &upper](double estimate) {
        return estimate > static_cast<double>(lower) && estimate < static_cast<double>(upper);
    };
    const double mu = mean();
    const double sigma = std::sqrt(variance());
    if (std::isfinite(mu) && isFiniteStrictlyPositive(sigma)) {
        const double lowerEstimate = mu - sigma * std::sqrt(q / p);
        if (inBracket(lowerEstimate)) {
            lower = static_cast<int64_t>(std::ceil(lowerEstimate)) - 1;
        }
        const double upperEstimate = mu + sigma * std::sqrt(p / q);
        if (inBracket(upperEstimate)) {
            upper = static_cast<int64_t>(std::floor(upperEstimate));
        }
    }

    return bisect(reached, lower, upper);
}

//-------------------------------------------------------------------------

}  // namespace statdist::stats

//-------------------------------------------------------------------------
