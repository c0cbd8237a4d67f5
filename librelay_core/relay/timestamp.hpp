// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "relay/detail/core_export.hpp"

namespace relay {

/// A portable timespan type with nanosecond resolution.
using timespan = std::chrono::duration<int64_t, std::nano>;

/// A portable timestamp with nanosecond resolution anchored at the UNIX epoch.
using timestamp = std::chrono::time_point<std::chrono::system_clock, timespan>;

/// Convenience function for returning a `timestamp` representing
/// the current system time.
RELAY_CORE_EXPORT timestamp make_timestamp();

/// Prints `x` as nanoseconds since the epoch.
RELAY_CORE_EXPORT std::string timestamp_to_string(timestamp x);

} // namespace relay
