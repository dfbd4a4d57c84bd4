/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "statdist/stats/PoissonDistribution.hpp"

#include "common.hpp"
#include "logging.hpp"
#include "statdist/numerics/SaddlePointExpansion.hpp"
#include "statdist/numerics/SpecialFunctions.hpp"
#include "statdist/numerics/constants.hpp"
#include "statdist/stats/DistributionException.hpp"

//-------------------------------------------------------------------------

namespace statdist::stats
{

//-------------------------------------------------------------------------

namespace
{

constexpr double kMaxExactSamplerMean = 0.5 * kMaxInt;

// Truncates a real sample to [0, kMaxInt]; NaN maps to 0.
[[nodiscard]] int32_t truncateToSupport(double x) noexcept
{
    if (!(x >= 0.0)) {
        return 0;
    }
    else if (x >= static_cast<double>(kMaxInt)) {
        return kMaxInt;
    }
    return static_cast<int32_t>(x);
}

}  // namespace

//-------------------------------------------------------------------------

PoissonDistribution::PoissonDistribution(double mean)
    : m_mean{mean}
{
    if (!(mean > 0.0)) {
        throw DistributionException::notStrictlyPositive("mean", mean);
    }
}

//-------------------------------------------------------------------------

double PoissonDistribution::probability(int32_t x) const
{
    return std::exp(logProbability(x));
}

//-------------------------------------------------------------------------

double PoissonDistribution::logProbability(int32_t x) const
{
    if (x < 0) {
        return -kInf;
    }
    else if (x == 0) {
        return -m_mean;
    }
    return -numerics::stirlingError(x)
        - numerics::deviancePart(x, m_mean)
        - numerics::kHalfLogTwoPi
        - 0.5 * std::log(x);
}

//-------------------------------------------------------------------------

double PoissonDistribution::cumulativeProbability(int32_t x) const
{
    if (x < 0) {
        return 0.0;
    }
    else if (x == 0) {
        return std::exp(-m_mean);
    }
    return numerics::regularizedGammaQ(static_cast<double>(x) + 1.0, m_mean);
}

//-------------------------------------------------------------------------

double PoissonDistribution::survivalProbability(int32_t x) const
{
    if (x < 0) {
        return 1.0;
    }
    else if (x == 0) {
        return -std::expm1(-m_mean);
    }
    return numerics::regularizedGammaP(static_cast<double>(x) + 1.0, m_mean);
}

//-------------------------------------------------------------------------

int32_t PoissonDistribution::supportUpperBound() const noexcept
{
    return kMaxInt;
}

//-------------------------------------------------------------------------

std::unique_ptr<DiscreteSampler> PoissonDistribution::createSampler(std::mt19937& rng) const
{
    if (m_mean < kMaxExactSamplerMean) {
        return makeSampler<int32_t>(
            [&rng, dist = std::poisson_distribution<int32_t>{m_mean}]() mutable {
                return dist(rng);
            });
    }

    log::logger().debug(
        "Poisson mean {} exceeds {}, sampling from the normal approximation",
        m_mean, kMaxExactSamplerMean);

    // The 0.5 shift rounds the truncated sample to the nearest integer.
    return makeSampler<int32_t>(
        [&rng, dist = std::normal_distribution<double>{m_mean + 0.5, std::sqrt(m_mean)}]()
            mutable {
            return truncateToSupport(dist(rng));
        });
}

//-------------------------------------------------------------------------

std::unique_ptr<PoissonDistribution> PoissonDistribution::fromXML(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (pugi::xml_attribute attr = node.attribute("mean")) {
        return std::make_unique<PoissonDistribution>(attr.as_double());
    }
    throw std::invalid_argument{fmt::format(
        "{}: missing required attribute '{}'", ctx, "mean")};
}

//-------------------------------------------------------------------------

}  // namespace statdist::stats

//-------------------------------------------------------------------------
