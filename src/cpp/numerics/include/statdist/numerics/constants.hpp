/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

//-------------------------------------------------------------------------

namespace statdist::numerics
{

//-------------------------------------------------------------------------

// Closest doubles to the exact values.
inline constexpr double kHalfLogTwoPi = 0.9189385332046728;

//-------------------------------------------------------------------------

}  // namespace statdist::numerics

//-------------------------------------------------------------------------
