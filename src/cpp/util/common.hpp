/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <fmt/core.h>
#include <fmt/format.h>
#include <magic_enum.hpp>
#include <pugixml.hpp>
#include <range/v3/all.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <random>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

//-------------------------------------------------------------------------

namespace views = ranges::views;

//-------------------------------------------------------------------------

namespace statdist
{

inline constexpr double kInf = std::numeric_limits<double>::infinity();
inline constexpr double kMaxDouble = std::numeric_limits<double>::max();
inline constexpr int32_t kMinInt = std::numeric_limits<int32_t>::min();
inline constexpr int32_t kMaxInt = std::numeric_limits<int32_t>::max();

}  // namespace statdist

//-------------------------------------------------------------------------
