/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "statdist/stats/DistributionException.hpp"

#include <cmath>
#include <source_location>

//-------------------------------------------------------------------------

namespace statdist::stats
{

//-------------------------------------------------------------------------

[[nodiscard]] inline bool isFiniteStrictlyPositive(double x) noexcept
{
    return x > 0.0 && std::isfinite(x);
}

//-------------------------------------------------------------------------

inline void checkProbability(double p, std::source_location loc = std::source_location::current())
{
    if (!(p >= 0.0 && p <= 1.0)) {
        throw DistributionException::invalidProbability(p, loc);
    }
}

//-------------------------------------------------------------------------

}  // namespace statdist::stats

//-------------------------------------------------------------------------
