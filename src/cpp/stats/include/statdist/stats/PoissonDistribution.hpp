/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "statdist/stats/DiscreteDistribution.hpp"

#include <pugixml.hpp>

#include <memory>

//-------------------------------------------------------------------------

namespace statdist::stats
{

//-------------------------------------------------------------------------

class PoissonDistribution : public DiscreteDistribution
{
public:
    explicit PoissonDistribution(double mean);

    using DiscreteDistribution::probability;

    virtual double probability(int32_t x) const override;
    virtual double logProbability(int32_t x) const override;
    virtual double cumulativeProbability(int32_t x) const override;
    virtual double survivalProbability(int32_t x) const override;

    virtual double mean() const noexcept override { return m_mean; }
    virtual double variance() const noexcept override { return m_mean; }
    virtual int32_t supportLowerBound() const noexcept override { return 0; }
    virtual int32_t supportUpperBound() const noexcept override;

    /**
     * Exact sampling below half of INT32_MAX; above that, a normal approximation
     * N(mean + 0.5, sqrt(mean)) truncated to the support.
     */
    virtual std::unique_ptr<DiscreteSampler> createSampler(std::mt19937& rng) const override;

    [[nodiscard]] static std::unique_ptr<PoissonDistribution> fromXML(pugi::xml_node node);

private:
    double m_mean;
};

//-------------------------------------------------------------------------

}  // namespace statdist::stats

//-------------------------------------------------------------------------
