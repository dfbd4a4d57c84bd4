/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "statdist/stats/Sampler.hpp"

#include <memory>
#include <random>

//-------------------------------------------------------------------------

namespace statdist::stats
{

//-------------------------------------------------------------------------

/**
 * Distribution of a real-valued random variable.
 *
 * Derived classes provide the density, the CDF, the moments and the support.
 * The remaining operations have defaults expressed through those, and are
 * overridden wherever the composition loses accuracy.
 *
 * Instances are immutable; every member may be called concurrently.
 */
class ContinuousDistribution
{
public:
    virtual ~ContinuousDistribution() noexcept = default;

    [[nodiscard]] virtual double density(double x) const = 0;

    // log(density(x)) unless overridden.
    [[nodiscard]] virtual double logDensity(double x) const;

    // P(X <= x)
    [[nodiscard]] virtual double cumulativeProbability(double x) const = 0;

    // P(X > x), 1 - cumulativeProbability(x) unless overridden.
    [[nodiscard]] virtual double survivalProbability(double x) const;

    /**
     * P(x0 < X <= x1). Splits at the median to subtract survival probabilities in
     * the upper half of the distribution.
     *
     * @throws DistributionException (InvalidRange) if x0 > x1.
     */
    [[nodiscard]] virtual double probability(double x0, double x1) const;

    /**
     * Smallest x with cumulativeProbability(x) >= p. Returns the support lower bound
     * for p = 0 and the upper bound for p = 1.
     *
     * @throws DistributionException (InvalidProbability) if p is outside [0, 1].
     */
    [[nodiscard]] virtual double inverseCumulativeProbability(double p) const;

    // Smallest x with survivalProbability(x) <= p.
    [[nodiscard]] virtual double inverseSurvivalProbability(double p) const;

    [[nodiscard]] virtual double mean() const noexcept = 0;
    [[nodiscard]] virtual double variance() const noexcept = 0;
    [[nodiscard]] virtual double supportLowerBound() const noexcept = 0;
    [[nodiscard]] virtual double supportUpperBound() const noexcept = 0;

    /**
     * Sampler drawing from rng. Both the distribution and rng must outlive the sampler.
     * The default uses inversion of a uniform variate.
     */
    [[nodiscard]] virtual std::unique_ptr<ContinuousSampler> createSampler(
        std::mt19937& rng) const;

protected:
    [[nodiscard]] virtual double median() const;

    // False when the CDF has flat regions inside the support.
    [[nodiscard]] virtual bool isSupportConnected() const noexcept { return true; }

private:
    [[nodiscard]] double inverseProbability(double p, double q, bool complement) const;
    [[nodiscard]] double finiteLowerBound(
        double p, double q, bool complement, double upperBound, double mu, double sigma,
        bool chebyshevApplies) const;
    [[nodiscard]] double finiteUpperBound(
        double p, double q, bool complement, double lowerBound, double mu, double sigma,
        bool chebyshevApplies) const;
    [[nodiscard]] double searchPlateau(bool complement, double lower, double x) const;
};

//-------------------------------------------------------------------------

}  // namespace statdist::stats

//-------------------------------------------------------------------------
