/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "statdist/stats/ContinuousDistribution.hpp"

#include <pugixml.hpp>

#include <memory>

//-------------------------------------------------------------------------

namespace statdist::stats
{

//-------------------------------------------------------------------------

/**
 * Double exponential distribution with location mu and scale beta. The density at
 * mu, where it has no derivative, is its limit 1 / (2 beta).
 */
class LaplaceDistribution : public ContinuousDistribution
{
public:
    LaplaceDistribution(double mu, double beta);

    [[nodiscard]] double location() const noexcept { return m_mu; }
    [[nodiscard]] double scale() const noexcept { return m_beta; }

    virtual double density(double x) const override;
    virtual double logDensity(double x) const override;
    virtual double cumulativeProbability(double x) const override;
    virtual double survivalProbability(double x) const override;
    virtual double inverseCumulativeProbability(double p) const override;
    virtual double inverseSurvivalProbability(double p) const override;

    virtual double mean() const noexcept override { return m_mu; }
    virtual double variance() const noexcept override { return 2.0 * m_beta * m_beta; }
    virtual double supportLowerBound() const noexcept override;
    virtual double supportUpperBound() const noexcept override;

    virtual std::unique_ptr<ContinuousSampler> createSampler(
        std::mt19937& rng) const override;

    [[nodiscard]] static std::unique_ptr<LaplaceDistribution> fromXML(pugi::xml_node node);

protected:
    // Lets the default probability(x0, x1) split at the location without a search.
    virtual double median() const override { return m_mu; }

private:
    double m_mu;
    double m_beta;
    double m_log2Beta;
};

//-------------------------------------------------------------------------

}  // namespace statdist::stats

//-------------------------------------------------------------------------
