/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "matchers.hpp"
#include "statdist/stats/PoissonDistribution.hpp"

#include <boost/math/special_functions/gamma.hpp>
#include <boost/multiprecision/cpp_bin_float.hpp>
#include <fmt/format.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cmath>
#include <limits>

//-------------------------------------------------------------------------

using namespace statdist::stats;
using namespace statdist::test;

using namespace testing;

using boost::multiprecision::cpp_bin_float_50;

//-------------------------------------------------------------------------

namespace
{

cpp_bin_float_50 referenceLogProbability(int32_t x, double mean)
{
    const cpp_bin_float_50 mu{mean};
    const cpp_bin_float_50 k{x};
    return -mu + k * log(mu) - boost::math::lgamma(cpp_bin_float_50{k + 1});
}

// P(X > x) summed term by term.
cpp_bin_float_50 referenceSurvival(int32_t x, double mean)
{
    const cpp_bin_float_50 mu{mean};
    cpp_bin_float_50 term = exp(referenceLogProbability(x + 1, mean));
    cpp_bin_float_50 sum = 0;
    for (int32_t k = x + 1; k < x + 400; ++k) {
        sum += term;
        term *= mu / (k + 1);
    }
    return sum;
}

}  // namespace

//-------------------------------------------------------------------------

TEST(PoissonDistributionTest, ProbabilityAtZero)
{
    const PoissonDistribution dist{4.0};

    EXPECT_EQ(dist.probability(0), std::exp(-4.0));
    EXPECT_EQ(dist.cumulativeProbability(0), std::exp(-4.0));
    EXPECT_EQ(dist.logProbability(0), -4.0);
    EXPECT_DOUBLE_EQ(dist.survivalProbability(0), 1.0 - std::exp(-4.0));
}

TEST(PoissonDistributionTest, OutsideSupport)
{
    const PoissonDistribution dist{4.0};

    EXPECT_EQ(dist.probability(-1), 0.0);
    EXPECT_EQ(dist.logProbability(-1), -std::numeric_limits<double>::infinity());
    EXPECT_EQ(dist.cumulativeProbability(-1), 0.0);
    EXPECT_EQ(dist.survivalProbability(-1), 1.0);
    EXPECT_EQ(dist.supportLowerBound(), 0);
    EXPECT_EQ(dist.supportUpperBound(), std::numeric_limits<int32_t>::max());
}

//-------------------------------------------------------------------------

struct PoissonProbabilityTestParams
{
    double mean;
    int32_t x;
};

void PrintTo(const PoissonProbabilityTestParams& params, std::ostream* os)
{
    *os << fmt::format("{{.mean = {}, .x = {}}}", params.mean, params.x);
}

class PoissonProbabilityTest : public TestWithParam<PoissonProbabilityTestParams>
{};

TEST_P(PoissonProbabilityTest, MatchesReference)
{
    const auto [mean, x] = GetParam();
    const PoissonDistribution dist{mean};

    const double expected = static_cast<double>(referenceLogProbability(x, mean));
    EXPECT_THAT(dist.logProbability(x), RelativelyNear(expected, 1e-13));
    EXPECT_THAT(dist.probability(x), RelativelyNear(std::exp(expected), 1e-11));
}

INSTANTIATE_TEST_SUITE_P(
    PoissonDistribution,
    PoissonProbabilityTest,
    Values(
        PoissonProbabilityTestParams{.mean = 4.0, .x = 1},
        PoissonProbabilityTestParams{.mean = 4.0, .x = 4},
        PoissonProbabilityTestParams{.mean = 4.0, .x = 30},
        PoissonProbabilityTestParams{.mean = 4.0, .x = 1000},
        PoissonProbabilityTestParams{.mean = 0.01, .x = 3},
        PoissonProbabilityTestParams{.mean = 250.5, .x = 240},
        PoissonProbabilityTestParams{.mean = 1e6, .x = 1000123}));

//-------------------------------------------------------------------------

TEST(PoissonDistributionTest, ProbabilityMatchesClosedForm)
{
    const PoissonDistribution dist{4.0};

    EXPECT_THAT(dist.probability(4), RelativelyNear(0.19536681481316456, 1e-14));
}

TEST(PoissonDistributionTest, UpperTailSurvival)
{
    const PoissonDistribution dist{4.0};

    EXPECT_EQ(dist.cumulativeProbability(30), 1.0);
    EXPECT_THAT(
        dist.survivalProbability(30),
        RelativelyNear(static_cast<double>(referenceSurvival(30, 4.0)), 1e-12));
}

TEST(PoissonDistributionTest, CumulativeAndSurvivalAreComplementary)
{
    const PoissonDistribution dist{4.0};

    for (int32_t x = 0; x <= 15; ++x) {
        EXPECT_THAT(
            dist.cumulativeProbability(x) + dist.survivalProbability(x), DoubleNear(1.0, 1e-14))
            << "x = " << x;
    }
}

TEST(PoissonDistributionTest, InverseCumulativeProbability)
{
    const PoissonDistribution dist{4.0};

    EXPECT_EQ(dist.inverseCumulativeProbability(0.0), 0);
    EXPECT_EQ(dist.inverseCumulativeProbability(1.0), std::numeric_limits<int32_t>::max());
    EXPECT_EQ(dist.inverseCumulativeProbability(0.5), 4);
    EXPECT_EQ(dist.inverseSurvivalProbability(0.0), std::numeric_limits<int32_t>::max());
    EXPECT_EQ(dist.inverseSurvivalProbability(1.0), 0);

    for (int32_t x = 0; x <= 12; ++x) {
        EXPECT_EQ(dist.inverseCumulativeProbability(dist.cumulativeProbability(x)), x);
        EXPECT_EQ(dist.inverseSurvivalProbability(dist.survivalProbability(x)), x);
    }
}

TEST(PoissonDistributionTest, RangedProbability)
{
    const PoissonDistribution dist{4.0};

    EXPECT_EQ(dist.probability(3, 3), 0.0);
    EXPECT_DOUBLE_EQ(dist.probability(3, 4), dist.probability(4));
    EXPECT_THAT(
        dist.probability(30, 1000),
        RelativelyNear(static_cast<double>(referenceSurvival(30, 4.0)), 1e-10));
    EXPECT_THAT(
        [&] { (void)dist.probability(5, 2); },
        ThrowsDistributionError(DistributionErrorKind::InvalidRange));
}

TEST(PoissonDistributionTest, MeanBeyondIntegerRange)
{
    const PoissonDistribution dist{1e19};

    EXPECT_EQ(dist.cumulativeProbability(std::numeric_limits<int32_t>::max() - 1), 0.0);
    EXPECT_EQ(dist.inverseCumulativeProbability(0.5), std::numeric_limits<int32_t>::max());
    EXPECT_EQ(dist.inverseSurvivalProbability(0.5), std::numeric_limits<int32_t>::max());
    EXPECT_EQ(dist.inverseCumulativeProbability(1e-300), std::numeric_limits<int32_t>::max());
    EXPECT_EQ(dist.probability(0, 10), 0.0);
}

TEST(PoissonDistributionTest, RejectsNonPositiveMean)
{
    for (double mean : {0.0, -1.0, std::numeric_limits<double>::quiet_NaN()}) {
        EXPECT_THAT(
            [&] { PoissonDistribution{mean}; },
            ThrowsDistributionError(DistributionErrorKind::InvalidParameter));
    }
}

//-------------------------------------------------------------------------

TEST(PoissonDistributionTest, SamplerMean)
{
    const PoissonDistribution dist{4.0};
    std::mt19937 rng{42};

    auto sampler = dist.createSampler(rng);

    static constexpr int kCount = 50000;
    int64_t sum = 0;
    for (int i = 0; i < kCount; ++i) {
        const int32_t x = sampler->sample();
        ASSERT_GE(x, 0);
        sum += x;
    }
    EXPECT_THAT(static_cast<double>(sum) / kCount, DoubleNear(4.0, 0.05));
}

TEST(PoissonDistributionTest, SamplerWithLargeMeanStaysInSupport)
{
    const PoissonDistribution dist{2e9};
    std::mt19937 rng{42};

    auto sampler = dist.createSampler(rng);

    static constexpr int kCount = 10000;
    double sum = 0.0;
    for (int i = 0; i < kCount; ++i) {
        const int32_t x = sampler->sample();
        ASSERT_GE(x, 0);
        sum += x;
    }
    EXPECT_THAT(sum / kCount, DoubleNear(2e9, 1e6));
}

TEST(PoissonDistributionTest, SamplerWithInfiniteMeanStaysInSupport)
{
    const PoissonDistribution dist{std::numeric_limits<double>::infinity()};
    std::mt19937 rng{42};

    auto sampler = dist.createSampler(rng);

    // Normal draws around an infinite mean are +inf or NaN.
    for (int i = 0; i < 100; ++i) {
        EXPECT_THAT(sampler->sample(), AnyOf(0, std::numeric_limits<int32_t>::max()));
    }
}

//-------------------------------------------------------------------------
