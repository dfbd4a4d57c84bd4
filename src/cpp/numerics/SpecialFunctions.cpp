/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "statdist/numerics/SpecialFunctions.hpp"

#include <boost/math/special_functions/erf.hpp>
#include <boost/math/special_functions/gamma.hpp>

//-------------------------------------------------------------------------

namespace statdist::numerics
{

//-------------------------------------------------------------------------

namespace
{

// erf(x) == 0.5
constexpr double kErfCrossover = 0.4769362762044699;

}  // namespace

//-------------------------------------------------------------------------

double erf(double x)
{
    return boost::math::erf(x, Policy{});
}

//-------------------------------------------------------------------------

double erfc(double x)
{
    return boost::math::erfc(x, Policy{});
}

//-------------------------------------------------------------------------

double erfcInv(double z)
{
    return boost::math::erfc_inv(z, Policy{});
}

//-------------------------------------------------------------------------

double erfDifference(double x1, double x2)
{
    if (x1 > x2) {
        return -erfDifference(x2, x1);
    }

    if (x1 < -kErfCrossover) {
        if (x2 < 0.0) {
            return erfc(-x2) - erfc(-x1);
        }
    }
    else if (x2 > kErfCrossover && x1 > 0.0) {
        return erfc(x1) - erfc(x2);
    }

    return erf(x2) - erf(x1);
}

//-------------------------------------------------------------------------

double regularizedGammaP(double a, double x)
{
    return boost::math::gamma_p(a, x, Policy{});
}

//-------------------------------------------------------------------------

double regularizedGammaQ(double a, double x)
{
    return boost::math::gamma_q(a, x, Policy{});
}

//-------------------------------------------------------------------------

}  // namespace statdist::numerics

//-------------------------------------------------------------------------
