/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "statdist/stats/Sampler.hpp"

#include <cstdint>
#include <memory>
#include <random>

//-------------------------------------------------------------------------

namespace statdist::stats
{

//-------------------------------------------------------------------------

/**
 * Distribution of an integer-valued random variable.
 *
 * Outcomes are 32-bit integers; an unbounded support is reported with
 * INT32_MIN / INT32_MAX as its bounds.
 *
 * Derived classes overriding one overload of probability() should bring the
 * other into scope with a using-declaration.
 */
class DiscreteDistribution
{
public:
    virtual ~DiscreteDistribution() noexcept = default;

    // P(X = x)
    [[nodiscard]] virtual double probability(int32_t x) const = 0;

    [[nodiscard]] virtual double logProbability(int32_t x) const;

    [[nodiscard]] virtual double cumulativeProbability(int32_t x) const = 0;
    [[nodiscard]] virtual double survivalProbability(int32_t x) const;

    /**
     * P(x0 < X <= x1).
     *
     * @throws DistributionException (InvalidRange) if x0 > x1.
     */
    [[nodiscard]] virtual double probability(int32_t x0, int32_t x1) const;

    /**
     * Smallest x with cumulativeProbability(x) >= p.
     *
     * @throws DistributionException (InvalidProbability) if p is outside [0, 1].
     * @throws std::runtime_error if the CDF evaluates to NaN during the search.
     */
    [[nodiscard]] virtual int32_t inverseCumulativeProbability(double p) const;

    // Smallest x with survivalProbability(x) <= p.
    [[nodiscard]] virtual int32_t inverseSurvivalProbability(double p) const;

    [[nodiscard]] virtual double mean() const noexcept = 0;
    [[nodiscard]] virtual double variance() const noexcept = 0;
    [[nodiscard]] virtual int32_t supportLowerBound() const noexcept = 0;
    [[nodiscard]] virtual int32_t supportUpperBound() const noexcept = 0;

    [[nodiscard]] virtual std::unique_ptr<DiscreteSampler> createSampler(
        std::mt19937& rng) const;

protected:
    [[nodiscard]] virtual int32_t median() const;

private:
    [[nodiscard]] int32_t inverseProbability(double p, double q, bool complement) const;
};

//-------------------------------------------------------------------------

}  // namespace statdist::stats

//-------------------------------------------------------------------------
