/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "statdist/stats/ContinuousDistribution.hpp"

#include <pugixml.hpp>

#include <limits>
#include <memory>

//-------------------------------------------------------------------------

namespace statdist::stats
{

//-------------------------------------------------------------------------

/**
 * Degenerate distribution with all mass at one value. The density is 1 at the
 * value and 0 elsewhere.
 */
class ConstantContinuousDistribution : public ContinuousDistribution
{
public:
    explicit ConstantContinuousDistribution(double value) noexcept : m_value{value} {}

    virtual double density(double x) const override { return x == m_value ? 1.0 : 0.0; }
    virtual double logDensity(double x) const override
    {
        return x == m_value ? 0.0 : -std::numeric_limits<double>::infinity();
    }
    virtual double cumulativeProbability(double x) const override;
    virtual double survivalProbability(double x) const override;
    virtual double inverseCumulativeProbability(double p) const override;
    virtual double inverseSurvivalProbability(double p) const override;

    virtual double mean() const noexcept override { return m_value; }
    virtual double variance() const noexcept override { return 0.0; }
    virtual double supportLowerBound() const noexcept override { return m_value; }
    virtual double supportUpperBound() const noexcept override { return m_value; }

    // Never draws from rng.
    virtual std::unique_ptr<ContinuousSampler> createSampler(
        std::mt19937& rng) const override;

    [[nodiscard]] static std::unique_ptr<ConstantContinuousDistribution> fromXML(
        pugi::xml_node node);

protected:
    virtual double median() const override { return m_value; }

private:
    double m_value;
};

//-------------------------------------------------------------------------

}  // namespace statdist::stats

//-------------------------------------------------------------------------
