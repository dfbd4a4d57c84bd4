/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <spdlog/spdlog.h>

//-------------------------------------------------------------------------

namespace statdist::log
{

//-------------------------------------------------------------------------

// Library-wide logger named "statdist", writing to stderr at warn level by default.
[[nodiscard]] spdlog::logger& logger();

void setLevel(spdlog::level::level_enum level);

//-------------------------------------------------------------------------

}  // namespace statdist::log

//-------------------------------------------------------------------------
