/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "matchers.hpp"
#include "statdist/stats/ConstantContinuousDistribution.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <limits>

//-------------------------------------------------------------------------

using namespace statdist::stats;
using namespace statdist::test;

using namespace testing;

//-------------------------------------------------------------------------

TEST(ConstantContinuousDistributionTest, StepAtValue)
{
    const ConstantContinuousDistribution dist{5.0};

    EXPECT_EQ(dist.density(5.0), 1.0);
    EXPECT_EQ(dist.density(4.999), 0.0);
    EXPECT_EQ(dist.logDensity(5.0), 0.0);
    EXPECT_EQ(dist.logDensity(6.0), -std::numeric_limits<double>::infinity());
    EXPECT_EQ(dist.cumulativeProbability(4.999), 0.0);
    EXPECT_EQ(dist.cumulativeProbability(5.0), 1.0);
    EXPECT_EQ(dist.survivalProbability(4.999), 1.0);
    EXPECT_EQ(dist.survivalProbability(5.0), 0.0);
}

TEST(ConstantContinuousDistributionTest, Moments)
{
    const ConstantContinuousDistribution dist{-2.5};

    EXPECT_EQ(dist.mean(), -2.5);
    EXPECT_EQ(dist.variance(), 0.0);
    EXPECT_EQ(dist.supportLowerBound(), -2.5);
    EXPECT_EQ(dist.supportUpperBound(), -2.5);
}

TEST(ConstantContinuousDistributionTest, InverseReturnsValue)
{
    const ConstantContinuousDistribution dist{5.0};

    for (double p : {0.0, 0.25, 1.0}) {
        EXPECT_EQ(dist.inverseCumulativeProbability(p), 5.0);
        EXPECT_EQ(dist.inverseSurvivalProbability(p), 5.0);
    }
    EXPECT_THAT(
        [&] { (void)dist.inverseCumulativeProbability(1.5); },
        ThrowsDistributionError(DistributionErrorKind::InvalidProbability));
    EXPECT_THAT(
        [&] { (void)dist.inverseSurvivalProbability(std::numeric_limits<double>::quiet_NaN()); },
        ThrowsDistributionError(DistributionErrorKind::InvalidProbability));
}

TEST(ConstantContinuousDistributionTest, RangedProbability)
{
    const ConstantContinuousDistribution dist{5.0};

    EXPECT_EQ(dist.probability(4.0, 6.0), 1.0);
    EXPECT_EQ(dist.probability(4.0, 5.0), 1.0);
    EXPECT_EQ(dist.probability(5.0, 6.0), 0.0);
    EXPECT_EQ(dist.probability(6.0, 7.0), 0.0);
}

TEST(ConstantContinuousDistributionTest, SamplerDoesNotConsumeRng)
{
    const ConstantContinuousDistribution dist{5.0};
    std::mt19937 rng{42};
    const std::mt19937 untouched = rng;

    auto sampler = dist.createSampler(rng);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(sampler->sample(), 5.0);
    }
    EXPECT_EQ(rng, untouched);
}

//-------------------------------------------------------------------------
