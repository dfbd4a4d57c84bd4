/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "statdist/stats/DistributionFactory.hpp"

#include "common.hpp"
#include "logging.hpp"
#include "statdist/stats/ConstantContinuousDistribution.hpp"
#include "statdist/stats/LaplaceDistribution.hpp"
#include "statdist/stats/NormalDistribution.hpp"
#include "statdist/stats/PoissonDistribution.hpp"
#include "statdist/stats/UniformDiscreteDistribution.hpp"

//-------------------------------------------------------------------------

namespace statdist::stats
{

//-------------------------------------------------------------------------

std::unique_ptr<ContinuousDistribution> DistributionFactory::createContinuousFromXML(
    pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    std::string_view type = node.attribute("type").as_string();

    log::logger().debug("{}: creating continuous distribution '{}'", ctx, type);

    if (type == "normal") {
        return NormalDistribution::fromXML(node);
    }
    else if (type == "laplace") {
        return LaplaceDistribution::fromXML(node);
    }
    else if (type == "constant") {
        return ConstantContinuousDistribution::fromXML(node);
    }

    throw std::invalid_argument{fmt::format(
        "{}: Unknown continuous distribution type '{}'", ctx, type)};
}

//-------------------------------------------------------------------------

std::unique_ptr<DiscreteDistribution> DistributionFactory::createDiscreteFromXML(
    pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    std::string_view type = node.attribute("type").as_string();

    log::logger().debug("{}: creating discrete distribution '{}'", ctx, type);

    if (type == "poisson") {
        return PoissonDistribution::fromXML(node);
    }
    else if (type == "uniformDiscrete") {
        return UniformDiscreteDistribution::fromXML(node);
    }

    throw std::invalid_argument{fmt::format(
        "{}: Unknown discrete distribution type '{}'", ctx, type)};
}

//-------------------------------------------------------------------------

void DistributionFactory::configureLogging(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    pugi::xml_node loggingNode = node.child("Logging");
    if (!loggingNode) {
        return;
    }

    std::string_view levelName = loggingNode.attribute("level").as_string();
    const auto level = magic_enum::enum_cast<spdlog::level::level_enum>(levelName);
    if (!level) {
        throw std::invalid_argument{fmt::format(
            "{}: Unknown log level '{}'", ctx, levelName)};
    }
    log::setLevel(*level);
}

//-------------------------------------------------------------------------

}  // namespace statdist::stats

//-------------------------------------------------------------------------
