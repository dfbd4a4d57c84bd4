/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "statdist/stats/ContinuousDistribution.hpp"
#include "statdist/stats/DiscreteDistribution.hpp"

#include <pugixml.hpp>

#include <memory>

//-------------------------------------------------------------------------

namespace statdist::stats
{

//-------------------------------------------------------------------------

/**
 * Builds distributions from XML nodes of the form
 * <pre>
 * &lt;Distribution type="normal" mean="0" sd="1"/&gt;
 * </pre>
 * Continuous types: normal (mean, sd), laplace (mu, beta), constant (value).
 * Discrete types: poisson (mean), uniformDiscrete (lower, upper).
 */
struct DistributionFactory
{
    [[nodiscard]] static std::unique_ptr<ContinuousDistribution> createContinuousFromXML(
        pugi::xml_node node);
    [[nodiscard]] static std::unique_ptr<DiscreteDistribution> createDiscreteFromXML(
        pugi::xml_node node);

    // Applies <Logging level="..."/> under node to the library logger, if present.
    static void configureLogging(pugi::xml_node node);
};

//-------------------------------------------------------------------------

}  // namespace statdist::stats

//-------------------------------------------------------------------------
