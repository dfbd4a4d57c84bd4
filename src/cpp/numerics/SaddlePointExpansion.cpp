/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "statdist/numerics/SaddlePointExpansion.hpp"

#include <array>
#include <cmath>
#include <limits>

//-------------------------------------------------------------------------

namespace statdist::numerics
{

//-------------------------------------------------------------------------

namespace
{

constexpr int32_t kStirlingTableMax = 15;

// Indexed by 2 * n for n = 0, 0.5, 1, ..., 15.
constexpr std::array<double, 2 * kStirlingTableMax + 1> kExactStirlingErrors{
    0.0,
    0.1534264097200273452913848,
    0.0810614667953272582196702,
    0.0548141210519176538961390,
    0.0413406959554092940938221,
    0.03316287351993628748511048,
    0.02767792568499833914878929,
    0.02374616365629749597132920,
    0.02079067210376509311152277,
    0.01848845053267318523077934,
    0.01664469118982119216319487,
    0.01513497322191737887351255,
    0.01387612882307074799874573,
    0.01281046524292022692424986,
    0.01189670994589177009505572,
    0.01110455975820691732662991,
    0.010411265261972096497478567,
    0.009799416126158803298389475,
    0.009255462182712732917728637,
    0.008768700134139385462952823,
    0.008330563433362871256469318,
    0.007934114564314020547248100,
    0.007573675487951840794972024,
    0.007244554301320383179543912,
    0.006942840107209529865664152,
    0.006665247032707682442354394,
    0.006408994188004207068439631,
    0.006171712263039457647532867,
    0.005951370112758847735624416,
    0.005746216513010115682023589,
    0.005554733551962801371038690
};

// Coefficients 1/12, 1/360, 1/1260, 1/1680, 1/1188 of the Stirling series.
constexpr double kS0 = 1.0 / 12.0;
constexpr double kS1 = 1.0 / 360.0;
constexpr double kS2 = 1.0 / 1260.0;
constexpr double kS3 = 1.0 / 1680.0;
constexpr double kS4 = 1.0 / 1188.0;

}  // namespace

//-------------------------------------------------------------------------

double stirlingError(int32_t n) noexcept
{
    if (n <= kStirlingTableMax) {
        return kExactStirlingErrors[2 * n];
    }
    const double z = n;
    const double z2 = z * z;
    return (kS0 - (kS1 - (kS2 - (kS3 - kS4 / z2) / z2) / z2) / z2) / z;
}

//-------------------------------------------------------------------------

double deviancePart(int32_t x, double mu) noexcept
{
    if (std::abs(x - mu) < 0.1 * (x + mu)) {
        const double d = x - mu;
        double v = d / (x + mu);
        double s1 = v * d;
        double s = std::numeric_limits<double>::quiet_NaN();
        double ej = 2.0 * x * v;
        v *= v;
        for (int32_t j = 1; s1 != s; ++j) {
            s = s1;
            ej *= v;
            s1 = s + ej / (2 * j + 1);
        }
        return s1;
    }
    else if (x == 0) {
        return mu;
    }
    return x * std::log(x / mu) + mu - x;
}

//-------------------------------------------------------------------------

}  // namespace statdist::numerics

//-------------------------------------------------------------------------
