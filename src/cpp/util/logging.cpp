/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "logging.hpp"

#include <spdlog/sinks/stdout_sinks.h>

#include <memory>

//-------------------------------------------------------------------------

namespace statdist::log
{

//-------------------------------------------------------------------------

spdlog::logger& logger()
{
    static const std::unique_ptr<spdlog::logger> s_logger = [] {
        auto logger = std::make_unique<spdlog::logger>(
            "statdist", std::make_shared<spdlog::sinks::stderr_sink_mt>());
        logger->set_level(spdlog::level::warn);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
        return logger;
    }();
    return *s_logger;
}

//-------------------------------------------------------------------------

void setLevel(spdlog::level::level_enum level)
{
    logger().set_level(level);
}

//-------------------------------------------------------------------------

}  // namespace statdist::log

//-------------------------------------------------------------------------
