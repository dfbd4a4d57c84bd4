/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <cstdint>

//-------------------------------------------------------------------------

namespace statdist::numerics
{

//-------------------------------------------------------------------------

/**
 * Error of Stirling's series for log(n!):
 * <pre>
 * log(n!) - (n + 0.5) * log(n) + n - 0.5 * log(2 * pi)
 * </pre>
 * Tabulated exactly for n <= 15, evaluated by the asymptotic series otherwise.
 */
[[nodiscard]] double stirlingError(int32_t n) noexcept;

/**
 * Deviance term x * log(x / mu) + mu - x of the saddle point approximation,
 * evaluated by a series when x is close to mu (Loader 2000, "Fast and Accurate
 * Computation of Binomial Probabilities").
 */
[[nodiscard]] double deviancePart(int32_t x, double mu) noexcept;

//-------------------------------------------------------------------------

}  // namespace statdist::numerics

//-------------------------------------------------------------------------
