/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <boost/math/policies/policy.hpp>

//-------------------------------------------------------------------------

namespace statdist::numerics
{

//-------------------------------------------------------------------------

// Evaluation policy for Boost.Math: out-of-domain arguments give NaN and overflow
// gives +/-inf, so IEEE special values propagate instead of raising.
using Policy = boost::math::policies::policy<
    boost::math::policies::domain_error<boost::math::policies::ignore_error>,
    boost::math::policies::pole_error<boost::math::policies::ignore_error>,
    boost::math::policies::overflow_error<boost::math::policies::ignore_error>,
    boost::math::policies::evaluation_error<boost::math::policies::ignore_error>,
    boost::math::policies::rounding_error<boost::math::policies::ignore_error>>;

//-------------------------------------------------------------------------

[[nodiscard]] double erf(double x);
[[nodiscard]] double erfc(double x);

// Inverse of erfc on [0, 2]; returns +inf at 0 and -inf at 2.
[[nodiscard]] double erfcInv(double z);

// erf(x2) - erf(x1), switching to the erfc form in either tail to avoid cancellation.
[[nodiscard]] double erfDifference(double x1, double x2);

// Regularized incomplete gamma functions P(a, x) and Q(a, x) = 1 - P(a, x).
[[nodiscard]] double regularizedGammaP(double a, double x);
[[nodiscard]] double regularizedGammaQ(double a, double x);

//-------------------------------------------------------------------------

}  // namespace statdist::numerics

//-------------------------------------------------------------------------
