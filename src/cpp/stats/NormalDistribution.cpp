/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "statdist/stats/NormalDistribution.hpp"

#include "argument_utils.hpp"
#include "common.hpp"
#include "statdist/numerics/ExtendedPrecision.hpp"
#include "statdist/numerics/SpecialFunctions.hpp"
#include "statdist/numerics/constants.hpp"

//-------------------------------------------------------------------------

namespace statdist::stats
{

//-------------------------------------------------------------------------

namespace
{

// Beyond 40 standard deviations the CDF is 0 or 1 in double precision.
constexpr double kTailCutoff = 40.0;

}  // namespace

//-------------------------------------------------------------------------

NormalDistribution::NormalDistribution(double mean, double sd)
    : m_mean{mean},
      m_sd{sd}
{
    if (!(sd > 0.0)) {
        throw DistributionException::notStrictlyPositive("sd", sd);
    }
    m_logSdPlusHalfLog2Pi = std::log(sd) + numerics::kHalfLogTwoPi;
    m_sdSqrt2 = numerics::ExtendedPrecision::sqrt2xx(sd);
    m_sdSqrt2Pi = numerics::ExtendedPrecision::xsqrt2pi(sd);
}

//-------------------------------------------------------------------------

double NormalDistribution::density(double x) const
{
    const double z = (x - m_mean) / m_sd;
    return numerics::ExtendedPrecision::expmhxx(z) / m_sdSqrt2Pi;
}

//-------------------------------------------------------------------------

double NormalDistribution::logDensity(double x) const
{
    const double z = (x - m_mean) / m_sd;
    return -0.5 * z * z - m_logSdPlusHalfLog2Pi;
}

//-------------------------------------------------------------------------

double NormalDistribution::cumulativeProbability(double x) const
{
    const double dev = x - m_mean;
    if (std::abs(dev) > kTailCutoff * m_sd) {
        return dev < 0.0 ? 0.0 : 1.0;
    }
    return 0.5 * numerics::erfc(-dev / m_sdSqrt2);
}

//-------------------------------------------------------------------------

double NormalDistribution::survivalProbability(double x) const
{
    const double dev = x - m_mean;
    if (std::abs(dev) > kTailCutoff * m_sd) {
        return dev > 0.0 ? 0.0 : 1.0;
    }
    return 0.5 * numerics::erfc(dev / m_sdSqrt2);
}

//-------------------------------------------------------------------------

double NormalDistribution::probability(double x0, double x1) const
{
    if (x0 > x1) {
        throw DistributionException::invalidRange(x0, x1);
    }
    const double v0 = (x0 - m_mean) / m_sdSqrt2;
    const double v1 = (x1 - m_mean) / m_sdSqrt2;
    return 0.5 * numerics::erfDifference(v0, v1);
}

//-------------------------------------------------------------------------

double NormalDistribution::inverseCumulativeProbability(double p) const
{
    checkProbability(p);
    if (p == 0.0) {
        return -kInf;
    }
    else if (p == 1.0) {
        return kInf;
    }
    // Invert the smaller tail, where 2p is exact.
    if (p < 0.5) {
        return m_mean - m_sdSqrt2 * numerics::erfcInv(2.0 * p);
    }
    return m_mean + m_sdSqrt2 * numerics::erfcInv(2.0 * (1.0 - p));
}

//-------------------------------------------------------------------------

double NormalDistribution::inverseSurvivalProbability(double p) const
{
    checkProbability(p);
    if (p == 0.0) {
        return kInf;
    }
    else if (p == 1.0) {
        return -kInf;
    }
    if (p < 0.5) {
        return m_mean + m_sdSqrt2 * numerics::erfcInv(2.0 * p);
    }
    return m_mean - m_sdSqrt2 * numerics::erfcInv(2.0 * (1.0 - p));
}

//-------------------------------------------------------------------------

double NormalDistribution::supportLowerBound() const noexcept
{
    return -kInf;
}

//-------------------------------------------------------------------------

double NormalDistribution::supportUpperBound() const noexcept
{
    return kInf;
}

//-------------------------------------------------------------------------

std::unique_ptr<ContinuousSampler> NormalDistribution::createSampler(std::mt19937& rng) const
{
    return makeSampler<double>(
        [&rng, dist = std::normal_distribution<double>{m_mean, m_sd}]() mutable {
            return dist(rng);
        });
}

//-------------------------------------------------------------------------

std::unique_ptr<NormalDistribution> NormalDistribution::fromXML(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    auto getAttr = [&](const char* name) {
        if (pugi::xml_attribute attr = node.attribute(name)) {
            return attr.as_double();
        }
        throw std::invalid_argument{fmt::format(
            "{}: missing required attribute '{}'", ctx, name)};
    };

    const double mean = getAttr("mean");
    const double sd = getAttr("sd");
    return std::make_unique<NormalDistribution>(mean, sd);
}

//-------------------------------------------------------------------------

}  // namespace statdist::stats

//-------------------------------------------------------------------------
