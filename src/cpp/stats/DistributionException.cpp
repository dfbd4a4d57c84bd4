/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "statdist/stats/DistributionException.hpp"

#include <fmt/format.h>
#include <magic_enum.hpp>

//-------------------------------------------------------------------------

namespace statdist::stats
{

//-------------------------------------------------------------------------

namespace
{

[[nodiscard]] std::string formatMessage(
    DistributionErrorKind kind,
    std::string_view parameter,
    double value,
    std::optional<double> lowerBound,
    std::optional<double> upperBound,
    std::source_location loc)
{
    const auto detail = [&]() -> std::string {
        switch (kind) {
            case DistributionErrorKind::InvalidParameter:
                if (upperBound) {
                    return fmt::format("{} {} > upper bound {}", parameter, value, *upperBound);
                }
                return fmt::format("{} {} is not greater than 0", parameter, value);
            case DistributionErrorKind::InvalidProbability:
                return fmt::format("Not a probability: {} is out of range [0, 1]", value);
            case DistributionErrorKind::InvalidRange:
                return fmt::format(
                    "Lower bound {} > upper bound {}", lowerBound.value_or(value), *upperBound);
        }
        return {};
    }();

    return fmt::format(
        "{}: {}: {}", loc.function_name(), magic_enum::enum_name(kind), detail);
}

}  // namespace

//-------------------------------------------------------------------------

DistributionException::DistributionException(
    DistributionErrorKind kind,
    std::string_view parameter,
    double value,
    std::optional<double> lowerBound,
    std::optional<double> upperBound,
    std::source_location loc)
    : std::invalid_argument{formatMessage(kind, parameter, value, lowerBound, upperBound, loc)},
      m_kind{kind},
      m_parameter{parameter},
      m_value{value},
      m_lowerBound{lowerBound},
      m_upperBound{upperBound}
{}

//-------------------------------------------------------------------------

DistributionException DistributionException::notStrictlyPositive(
    std::string_view parameter, double value, std::source_location loc)
{
    return DistributionException{
        DistributionErrorKind::InvalidParameter, parameter, value, 0.0, std::nullopt, loc};
}

//-------------------------------------------------------------------------

DistributionException DistributionException::lowerAboveUpper(
    int64_t lower, int64_t upper, std::source_location loc)
{
    return DistributionException{
        DistributionErrorKind::InvalidParameter,
        "lower",
        static_cast<double>(lower),
        std::nullopt,
        static_cast<double>(upper),
        loc};
}

//-------------------------------------------------------------------------

DistributionException DistributionException::invalidProbability(
    double p, std::source_location loc)
{
    return DistributionException{
        DistributionErrorKind::InvalidProbability, "p", p, 0.0, 1.0, loc};
}

//-------------------------------------------------------------------------

DistributionException DistributionException::invalidRange(
    double x0, double x1, std::source_location loc)
{
    return DistributionException{
        DistributionErrorKind::InvalidRange, "x0", x0, x0, x1, loc};
}

//-------------------------------------------------------------------------

}  // namespace statdist::stats

//-------------------------------------------------------------------------
