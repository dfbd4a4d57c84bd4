/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "formatting.hpp"
#include "statdist/stats/DistributionException.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <optional>
#include <stdexcept>

//-------------------------------------------------------------------------

using namespace statdist::stats;

using namespace testing;

//-------------------------------------------------------------------------

TEST(DistributionExceptionTest, NotStrictlyPositive)
{
    const auto e = DistributionException::notStrictlyPositive("sd", -1.5);

    EXPECT_EQ(e.kind(), DistributionErrorKind::InvalidParameter);
    EXPECT_EQ(e.parameter(), "sd");
    EXPECT_EQ(e.value(), -1.5);
    EXPECT_THAT(e.lowerBound(), Optional(0.0));
    EXPECT_EQ(e.upperBound(), std::nullopt);
    EXPECT_THAT(
        e.what(),
        AllOf(HasSubstr("InvalidParameter"), HasSubstr("sd -1.5 is not greater than 0")));
}

TEST(DistributionExceptionTest, LowerAboveUpper)
{
    const auto e = DistributionException::lowerAboveUpper(7, 3);

    EXPECT_EQ(e.kind(), DistributionErrorKind::InvalidParameter);
    EXPECT_EQ(e.value(), 7.0);
    EXPECT_THAT(e.upperBound(), Optional(3.0));
    EXPECT_THAT(e.what(), HasSubstr("lower 7 > upper bound 3"));
}

TEST(DistributionExceptionTest, InvalidProbability)
{
    const auto e = DistributionException::invalidProbability(1.25);

    EXPECT_EQ(e.kind(), DistributionErrorKind::InvalidProbability);
    EXPECT_EQ(e.value(), 1.25);
    EXPECT_THAT(e.lowerBound(), Optional(0.0));
    EXPECT_THAT(e.upperBound(), Optional(1.0));
    EXPECT_THAT(
        e.what(),
        AllOf(
            HasSubstr("InvalidProbability"),
            HasSubstr("Not a probability: 1.25 is out of range [0, 1]")));
}

TEST(DistributionExceptionTest, InvalidRange)
{
    const auto e = DistributionException::invalidRange(2.0, -1.0);

    EXPECT_EQ(e.kind(), DistributionErrorKind::InvalidRange);
    EXPECT_THAT(e.lowerBound(), Optional(2.0));
    EXPECT_THAT(e.upperBound(), Optional(-1.0));
    EXPECT_THAT(
        e.what(), AllOf(HasSubstr("InvalidRange"), HasSubstr("Lower bound 2 > upper bound -1")));
}

TEST(DistributionExceptionTest, MessageNamesRaisingFunction)
{
    const auto e = DistributionException::invalidProbability(-0.5);
    EXPECT_THAT(e.what(), HasSubstr("MessageNamesRaisingFunction"));
}

TEST(DistributionExceptionTest, IsInvalidArgument)
{
    EXPECT_THROW(
        throw DistributionException::invalidRange(1.0, 0.0), std::invalid_argument);
}

//-------------------------------------------------------------------------
