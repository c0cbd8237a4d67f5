// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>

// -- hard-coded default values for various relay options ----------------------

namespace relay::defaults::buffer {

/// Number of non-terminal events a replay buffer keeps for late observers.
constexpr auto capacity = std::numeric_limits<size_t>::max();

} // namespace relay::defaults::buffer

namespace relay::defaults::timer {

/// A timer without explicit leeway may fire up to `interval / leeway_divisor`
/// late.
constexpr int64_t leeway_divisor = 10;

} // namespace relay::defaults::timer
