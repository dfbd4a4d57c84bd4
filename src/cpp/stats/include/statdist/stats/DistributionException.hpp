/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <cstdint>
#include <optional>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

namespace statdist::stats
{

//-------------------------------------------------------------------------

enum class DistributionErrorKind : uint8_t
{
    InvalidParameter,
    InvalidProbability,
    InvalidRange
};

//-------------------------------------------------------------------------

/**
 * Precondition violation of a distribution factory or contract method.
 * Carries the kind of violation and the offending values; the message is
 * rendered once, at construction.
 */
class DistributionException : public std::invalid_argument
{
public:
    DistributionException(
        DistributionErrorKind kind,
        std::string_view parameter,
        double value,
        std::optional<double> lowerBound,
        std::optional<double> upperBound,
        std::source_location loc);

    [[nodiscard]] DistributionErrorKind kind() const noexcept { return m_kind; }
    [[nodiscard]] const std::string& parameter() const noexcept { return m_parameter; }
    [[nodiscard]] double value() const noexcept { return m_value; }
    [[nodiscard]] std::optional<double> lowerBound() const noexcept { return m_lowerBound; }
    [[nodiscard]] std::optional<double> upperBound() const noexcept { return m_upperBound; }

    // parameter <= 0
    [[nodiscard]] static DistributionException notStrictlyPositive(
        std::string_view parameter,
        double value,
        std::source_location loc = std::source_location::current());

    // lower > upper for a pair of distribution parameters.
    [[nodiscard]] static DistributionException lowerAboveUpper(
        int64_t lower,
        int64_t upper,
        std::source_location loc = std::source_location::current());

    // p outside [0, 1]
    [[nodiscard]] static DistributionException invalidProbability(
        double p, std::source_location loc = std::source_location::current());

    // x0 > x1 in a ranged probability.
    [[nodiscard]] static DistributionException invalidRange(
        double x0, double x1, std::source_location loc = std::source_location::current());

private:
    DistributionErrorKind m_kind;
    std::string m_parameter;
    double m_value;
    std::optional<double> m_lowerBound;
    std::optional<double> m_upperBound;
};

//-------------------------------------------------------------------------

}  // namespace statdist::stats

//-------------------------------------------------------------------------
