/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

//-------------------------------------------------------------------------

namespace statdist::numerics
{

//-------------------------------------------------------------------------

/**
 * A double split into two non-overlapping parts with value == high + low exactly.
 * The high part holds the upper 26 bits of the significand; the low part holds the
 * remaining bits, with one extra bit of information carried by its sign.
 */
struct SplitValue
{
    double high;
    double low;
};

//-------------------------------------------------------------------------

/**
 * Extended precision floating-point routines after Dekker (1971),
 * "A floating-point technique for extending the available precision",
 * Numer. Math. 18, 224-242.
 *
 * Correctness depends on every intermediate being rounded to double precision.
 * Translation units using these routines must be compiled without floating-point
 * contraction (no fused multiply-add substitution).
 */
class ExtendedPrecision
{
public:
    ExtendedPrecision() = delete;

    /**
     * Computes sqrt(2 * x * x) to within 1 ULP without overflow or underflow of the
     * intermediate square.
     *
     * The argument is assumed to be non-negative; this is not checked. NaN returns NaN
     * and +inf returns +inf.
     */
    [[nodiscard]] static double sqrt2xx(double x) noexcept;

    /**
     * Computes x * sqrt(2 * pi) using the double-double value of sqrt(2 * pi).
     * The argument is assumed to be non-negative; this is not checked.
     */
    [[nodiscard]] static double xsqrt2pi(double x) noexcept;

    /**
     * Computes exp(-0.5 * x * x), recovering the round-off of the square.
     */
    [[nodiscard]] static double expmhxx(double x) noexcept;

    /**
     * Dekker's split. Multiplying by (2^27 + 1) creates a value from which the high
     * part is recovered exactly:
     * <pre>
     * c = (2^27 + 1) * a
     * a_hi = c - (c - a)
     * a_lo = a - a_hi
     * </pre>
     *
     * No scaling is applied: the result is NaN when the product overflows (exponent
     * above 996), and splitting NaN or an infinite value also gives NaN.
     */
    [[nodiscard]] static constexpr SplitValue split(double value) noexcept
    {
        const double hi = highPart(value);
        return {.high = hi, .low = value - hi};
    }

    [[nodiscard]] static constexpr double highPart(double value) noexcept
    {
        const double c = kMultiplier * value;
        return c - (c - value);
    }

    /**
     * Low part of the exact product of x and y given the rounded product xy and the
     * split parts of both factors (Shewchuk 1997, Theorem 18):
     * <code>lx * ly - (((xy - hx * hy) - lx * hy) - hx * ly)</code>
     */
    [[nodiscard]] static constexpr double productLow(
        double hx, double lx, double hy, double ly, double xy) noexcept
    {
        return lx * ly - (((xy - hx * hy) - lx * hy) - hx * ly);
    }

    // productLow specialised for x == y.
    [[nodiscard]] static constexpr double squareLow(double hx, double lx, double xx) noexcept
    {
        return lx * lx - ((xx - hx * hx) - 2 * lx * hx);
    }

    // 2^(53 - 53/2) + 1 for the 53-bit double significand.
    static constexpr double kMultiplier = 1.0 + 0x1.0p27;
};

//-------------------------------------------------------------------------

}  // namespace statdist::numerics

//-------------------------------------------------------------------------
