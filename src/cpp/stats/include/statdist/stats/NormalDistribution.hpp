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

class NormalDistribution : public ContinuousDistribution
{
public:
    /**
     * @throws DistributionException (InvalidParameter) unless sd > 0.
     */
    NormalDistribution(double mean, double sd);

    [[nodiscard]] double standardDeviation() const noexcept { return m_sd; }

    virtual double density(double x) const override;
    virtual double logDensity(double x) const override;
    virtual double cumulativeProbability(double x) const override;
    virtual double survivalProbability(double x) const override;
    virtual double probability(double x0, double x1) const override;
    virtual double inverseCumulativeProbability(double p) const override;
    virtual double inverseSurvivalProbability(double p) const override;

    virtual double mean() const noexcept override { return m_mean; }
    virtual double variance() const noexcept override { return m_sd * m_sd; }
    virtual double supportLowerBound() const noexcept override;
    virtual double supportUpperBound() const noexcept override;

    virtual std::unique_ptr<ContinuousSampler> createSampler(
        std::mt19937& rng) const override;

    [[nodiscard]] static std::unique_ptr<NormalDistribution> fromXML(pugi::xml_node node);

protected:
    virtual double median() const override { return m_mean; }

private:
    double m_mean;
    double m_sd;
    double m_logSdPlusHalfLog2Pi;
    // sd * sqrt(2), sd * sqrt(2 * pi), both to within 1 ulp.
    double m_sdSqrt2;
    double m_sdSqrt2Pi;
};

//-------------------------------------------------------------------------

}  // namespace statdist::stats

//-------------------------------------------------------------------------
