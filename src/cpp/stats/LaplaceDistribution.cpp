/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "statdist/stats/LaplaceDistribution.hpp"

#include "argument_utils.hpp"
#include "common.hpp"

#include <boost/random/laplace_distribution.hpp>

//-------------------------------------------------------------------------

namespace br = boost::random;

//-------------------------------------------------------------------------

namespace statdist::stats
{

//-------------------------------------------------------------------------

LaplaceDistribution::LaplaceDistribution(double mu, double beta)
    : m_mu{mu},
      m_beta{beta}
{
    if (!(beta > 0.0)) {
        throw DistributionException::notStrictlyPositive("beta", beta);
    }
    m_log2Beta = std::log(2.0 * beta);
}

//-------------------------------------------------------------------------

double LaplaceDistribution::density(double x) const
{
    return std::exp(-std::abs(x - m_mu) / m_beta) / (2.0 * m_beta);
}

//-------------------------------------------------------------------------

double LaplaceDistribution::logDensity(double x) const
{
    return -std::abs(x - m_mu) / m_beta - m_log2Beta;
}

//-------------------------------------------------------------------------

double LaplaceDistribution::cumulativeProbability(double x) const
{
    if (x <= m_mu) {
        return 0.5 * std::exp((x - m_mu) / m_beta);
    }
    return 1.0 - 0.5 * std::exp((m_mu - x) / m_beta);
}

//-------------------------------------------------------------------------

double LaplaceDistribution::survivalProbability(double x) const
{
    if (x <= m_mu) {
        return 1.0 - 0.5 * std::exp((x - m_mu) / m_beta);
    }
    return 0.5 * std::exp((m_mu - x) / m_beta);
}

//-------------------------------------------------------------------------

double LaplaceDistribution::inverseCumulativeProbability(double p) const
{
    checkProbability(p);
    if (p == 0.0) {
        return -kInf;
    }
    else if (p == 1.0) {
        return kInf;
    }
    const double x = p > 0.5 ? -std::log(2.0 * (1.0 - p)) : std::log(2.0 * p);
    return m_mu + m_beta * x;
}

//-------------------------------------------------------------------------

double LaplaceDistribution::inverseSurvivalProbability(double p) const
{
    checkProbability(p);
    if (p == 1.0) {
        return -kInf;
    }
    else if (p == 0.0) {
        return kInf;
    }
    // Mirror image of the inverse CDF.
    const double x = p > 0.5 ? std::log(2.0 * (1.0 - p)) : -std::log(2.0 * p);
    return m_mu + m_beta * x;
}

//-------------------------------------------------------------------------

double LaplaceDistribution::supportLowerBound() const noexcept
{
    return -kInf;
}

//-------------------------------------------------------------------------

double LaplaceDistribution::supportUpperBound() const noexcept
{
    return kInf;
}

//-------------------------------------------------------------------------

std::unique_ptr<ContinuousSampler> LaplaceDistribution::createSampler(std::mt19937& rng) const
{
    return makeSampler<double>(
        [&rng, dist = br::laplace_distribution<double>{m_mu, m_beta}]() mutable {
            return dist(rng);
        });
}

//-------------------------------------------------------------------------

std::unique_ptr<LaplaceDistribution> LaplaceDistribution::fromXML(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    auto getAttr = [&](const char* name) {
        if (pugi::xml_attribute attr = node.attribute(name)) {
            return attr.as_double();
        }
        throw std::invalid_argument{fmt::format(
            "{}: missing required attribute '{}'", ctx, name)};
    };

    const double mu = getAttr("mu");
    const double beta = getAttr("beta");
    return std::make_unique<LaplaceDistribution>(mu, beta);
}

//-------------------------------------------------------------------------

}  // namespace statdist::stats

//-------------------------------------------------------------------------
