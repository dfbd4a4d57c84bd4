/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "statdist/stats/ConstantContinuousDistribution.hpp"

#include "argument_utils.hpp"
#include "common.hpp"

//-------------------------------------------------------------------------

namespace statdist::stats
{

//-------------------------------------------------------------------------

double ConstantContinuousDistribution::cumulativeProbability(double x) const
{
    return x < m_value ? 0.0 : 1.0;
}

//-------------------------------------------------------------------------

double ConstantContinuousDistribution::survivalProbability(double x) const
{
    return x < m_value ? 1.0 : 0.0;
}

//-------------------------------------------------------------------------

double ConstantContinuousDistribution::inverseCumulativeProbability(double p) const
{
    checkProbability(p);
    return m_value;
}

//-------------------------------------------------------------------------

double ConstantContinuousDistribution::inverseSurvivalProbability(double p) const
{
    checkProbability(p);
    return m_value;
}

//-------------------------------------------------------------------------

std::unique_ptr<ContinuousSampler> ConstantContinuousDistribution::createSampler(
    [[maybe_unused]] std::mt19937& rng) const
{
    return makeSampler<double>([value = m_value] { return value; });
}

//-------------------------------------------------------------------------

std::unique_ptr<ConstantContinuousDistribution> ConstantContinuousDistribution::fromXML(
    pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    return std::make_unique<ConstantContinuousDistribution>(
        [&] {
            static constexpr const char* name = "value";
            if (pugi::xml_attribute attr = node.attribute(name)) {
                return attr.as_double();
            }
            throw std::invalid_argument{fmt::format(
                "{}: missing required attribute '{}'", ctx, name)};
        }());
}

//-------------------------------------------------------------------------

}  // namespace statdist::stats

//-------------------------------------------------------------------------
