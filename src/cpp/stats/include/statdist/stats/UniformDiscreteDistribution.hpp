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

// Equal mass on each integer of [lower, upper].
class UniformDiscreteDistribution : public DiscreteDistribution
{
public:
    UniformDiscreteDistribution(int32_t lower, int32_t upper);

    using DiscreteDistribution::probability;

    virtual double probability(int32_t x) const override;
    virtual double logProbability(int32_t x) const override;
    virtual double cumulativeProbability(int32_t x) const override;
    virtual double survivalProbability(int32_t x) const override;

    virtual double mean() const noexcept override { return 0.5 * m_upperPlusLower; }
    virtual double variance() const noexcept override;
    virtual int32_t supportLowerBound() const noexcept override { return m_lower; }
    virtual int32_t supportUpperBound() const noexcept override { return m_upper; }

    virtual std::unique_ptr<DiscreteSampler> createSampler(std::mt19937& rng) const override;

    [[nodiscard]] static std::unique_ptr<UniformDiscreteDistribution> fromXML(
        pugi::xml_node node);

private:
    int32_t m_lower;
    int32_t m_upper;
    // Exact in double for every int32 pair.
    double m_upperPlusLower;
    double m_upperMinusLower;
    double m_pmf;
};

//-------------------------------------------------------------------------

}  // namespace statdist::stats

//-------------------------------------------------------------------------
