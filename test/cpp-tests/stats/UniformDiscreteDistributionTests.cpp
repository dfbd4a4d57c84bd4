/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "matchers.hpp"
#include "statdist/stats/UniformDiscreteDistribution.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <array>
#include <cmath>
#include <limits>

//-------------------------------------------------------------------------

using namespace statdist::stats;
using namespace statdist::test;

using namespace testing;

//-------------------------------------------------------------------------

static constexpr int32_t s_minInt = std::numeric_limits<int32_t>::min();
static constexpr int32_t s_maxInt = std::numeric_limits<int32_t>::max();

//-------------------------------------------------------------------------

TEST(UniformDiscreteDistributionTest, DieValues)
{
    const UniformDiscreteDistribution dist{1, 6};

    EXPECT_DOUBLE_EQ(dist.probability(3), 1.0 / 6.0);
    EXPECT_DOUBLE_EQ(dist.logProbability(3), -std::log(6.0));
    EXPECT_EQ(dist.cumulativeProbability(3), 0.5);
    EXPECT_EQ(dist.survivalProbability(3), 0.5);
    EXPECT_EQ(dist.mean(), 3.5);
    EXPECT_DOUBLE_EQ(dist.variance(), 35.0 / 12.0);
    EXPECT_EQ(dist.supportLowerBound(), 1);
    EXPECT_EQ(dist.supportUpperBound(), 6);
}

TEST(UniformDiscreteDistributionTest, OutsideSupport)
{
    const UniformDiscreteDistribution dist{1, 6};

    EXPECT_EQ(dist.probability(0), 0.0);
    EXPECT_EQ(dist.probability(7), 0.0);
    EXPECT_EQ(dist.logProbability(0), -std::numeric_limits<double>::infinity());
    EXPECT_EQ(dist.cumulativeProbability(0), 0.0);
    EXPECT_EQ(dist.cumulativeProbability(6), 1.0);
    EXPECT_EQ(dist.survivalProbability(0), 1.0);
    EXPECT_EQ(dist.survivalProbability(6), 0.0);
}

TEST(UniformDiscreteDistributionTest, InverseCumulativeProbability)
{
    const UniformDiscreteDistribution dist{1, 6};

    EXPECT_EQ(dist.inverseCumulativeProbability(0.0), 1);
    EXPECT_EQ(dist.inverseCumulativeProbability(1.0), 6);
    EXPECT_EQ(dist.inverseCumulativeProbability(0.5), 3);
    EXPECT_EQ(dist.inverseCumulativeProbability(0.51), 4);
    EXPECT_EQ(dist.inverseSurvivalProbability(0.5), 3);
    EXPECT_EQ(dist.inverseSurvivalProbability(0.49), 4);
    EXPECT_EQ(dist.inverseSurvivalProbability(0.0), 6);
    EXPECT_EQ(dist.inverseSurvivalProbability(1.0), 1);
}

TEST(UniformDiscreteDistributionTest, RangedProbability)
{
    const UniformDiscreteDistribution dist{1, 6};

    EXPECT_DOUBLE_EQ(dist.probability(1, 4), 0.5);
    EXPECT_DOUBLE_EQ(dist.probability(-10, 10), 1.0);
    EXPECT_DOUBLE_EQ(dist.probability(2, 3), 1.0 / 6.0);
}

TEST(UniformDiscreteDistributionTest, SinglePoint)
{
    const UniformDiscreteDistribution dist{7, 7};

    EXPECT_EQ(dist.probability(7), 1.0);
    EXPECT_EQ(dist.logProbability(7), 0.0);
    EXPECT_EQ(dist.mean(), 7.0);
    EXPECT_EQ(dist.variance(), 0.0);
    EXPECT_EQ(dist.inverseCumulativeProbability(0.3), 7);
    EXPECT_EQ(dist.inverseSurvivalProbability(0.3), 7);
}

TEST(UniformDiscreteDistributionTest, FullIntegerRange)
{
    const UniformDiscreteDistribution dist{s_minInt, s_maxInt};

    EXPECT_EQ(dist.mean(), -0.5);
    EXPECT_DOUBLE_EQ(dist.probability(0), 0x1.0p-32);
    EXPECT_EQ(dist.cumulativeProbability(-1), 0.5);
    EXPECT_EQ(dist.inverseCumulativeProbability(0.5), -1);
    EXPECT_EQ(dist.inverseCumulativeProbability(0.0), s_minInt);
    EXPECT_EQ(dist.inverseCumulativeProbability(1.0), s_maxInt);
    EXPECT_DOUBLE_EQ(dist.variance(), (0x1.0p64 - 1.0) / 12.0);
}

TEST(UniformDiscreteDistributionTest, RejectsLowerAboveUpper)
{
    EXPECT_THAT(
        [] { UniformDiscreteDistribution{7, 3}; },
        ThrowsDistributionError(DistributionErrorKind::InvalidParameter));
    EXPECT_THAT(
        [] { UniformDiscreteDistribution{7, 3}; },
        ThrowsMessage<DistributionException>(HasSubstr("lower 7 > upper bound 3")));
}

TEST(UniformDiscreteDistributionTest, SamplerCoversSupport)
{
    const UniformDiscreteDistribution dist{-2, 2};
    std::mt19937 rng{42};

    auto sampler = dist.createSampler(rng);

    std::array<int, 5> counts{};
    static constexpr int kCount = 10000;
    for (int i = 0; i < kCount; ++i) {
        const int32_t x = sampler->sample();
        ASSERT_GE(x, -2);
        ASSERT_LE(x, 2);
        ++counts[x + 2];
    }
    for (int count : counts) {
        EXPECT_THAT(static_cast<double>(count) / kCount, DoubleNear(0.2, 0.02));
    }
}

//-------------------------------------------------------------------------
