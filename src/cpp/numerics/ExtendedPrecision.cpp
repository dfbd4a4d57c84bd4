/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "statdist/numerics/ExtendedPrecision.hpp"

#include <cmath>
#include <limits>

//-------------------------------------------------------------------------

namespace statdist::numerics
{

//-------------------------------------------------------------------------

namespace
{

// Squares of values above 2^500 may overflow, below 2^-500 may underflow.
constexpr double kBig = 0x1.0p500;
constexpr double kSmall = 0x1.0p-500;
constexpr double kScaleUp = 0x1.0p600;
constexpr double kScaleDown = 0x1.0p-600;

// sqrt(2 pi) as the unevaluated sum (high, low).
constexpr double kSqrt2PiHigh = 2.5066282746310007;
constexpr double kSqrt2PiLow = -1.8328579980459167e-16;
constexpr SplitValue kSqrt2PiSplit = ExtendedPrecision::split(kSqrt2PiHigh);

// exp(-0.5 * 1491) == 0
constexpr double kExpmhxxUnderflow = 1491.0;

//-------------------------------------------------------------------------

double computeSqrt2aa(double a) noexcept
{
    const auto [ha, la] = ExtendedPrecision::split(a);

    const double x = 2 * a * a;
    const double xx = ExtendedPrecision::productLow(ha, la, 2 * ha, 2 * la, x);

    const double c = std::sqrt(x);

    // No round-off in the square, e.g. a in {0, 1} or a with a short significand.
    if (xx == 0.0) {
        return c;
    }

    // Dekker (1971), sqrt2, p. 242.
    const auto [hc, lc] = ExtendedPrecision::split(c);
    const double u = c * c;
    const double uu = ExtendedPrecision::productLow(hc, lc, hc, lc, u);
    const double cc = (x - u - uu + xx) * 0.5 / c;

    return c + cc;
}

//-------------------------------------------------------------------------

double computeXsqrt2pi(double a) noexcept
{
    const auto [ha, la] = ExtendedPrecision::split(a);

    const double x = a * kSqrt2PiHigh;
    const double xx = ExtendedPrecision::productLow(
        ha, la, kSqrt2PiSplit.high, kSqrt2PiSplit.low, x);

    return x + (xx + a * kSqrt2PiLow);
}

//-------------------------------------------------------------------------

template<typename Compute>
double rangeReduced(double x, Compute compute) noexcept
{
    if (x > kBig) {
        if (x == std::numeric_limits<double>::infinity()) {
            return x;
        }
        return compute(x * kScaleDown) * kScaleUp;
    }
    else if (x < kSmall) {
        return compute(x * kScaleUp) * kScaleDown;
    }
    return compute(x);
}

}  // namespace

//-------------------------------------------------------------------------

double ExtendedPrecision::sqrt2xx(double x) noexcept
{
    return rangeReduced(x, computeSqrt2aa);
}

//-------------------------------------------------------------------------

double ExtendedPrecision::xsqrt2pi(double x) noexcept
{
    return rangeReduced(x, computeXsqrt2pi);
}

//-------------------------------------------------------------------------

double ExtendedPrecision::expmhxx(double x) noexcept
{
    const double z = x * x;
    if (z <= 0.5) {
        return std::exp(-0.5 * z);
    }
    else if (z >= kExpmhxxUnderflow) {
        return 0.0;
    }

    const auto [hx, lx] = split(x);
    const double zz = squareLow(hx, lx, z);

    // exp(a + b) = exp(a) * expm1(b) + exp(a)
    const double ea = std::exp(-0.5 * z);
    return ea * std::expm1(-0.5 * zz) + ea;
}

//-------------------------------------------------------------------------

}  // namespace statdist::numerics

//-------------------------------------------------------------------------
