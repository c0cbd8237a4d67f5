// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#pragma once

#include <string>

#include "relay/detail/core_export.hpp"

namespace relay {

/// Selects how `flatten` and `flat_map` combine a producer of producers.
enum class flatten_strategy {
  /// Starts each inner producer immediately and forwards all values as they
  /// arrive. Completes after the outer producer and all inner producers
  /// completed.
  merge,
  /// Starts one inner producer at a time in the order they arrive. Completes
  /// after the outer producer and all inner producers completed.
  concatenate,
  /// Forwards only the values of the latest inner producer and interrupts its
  /// predecessor. Completes after the outer producer and the latest inner
  /// producer completed.
  latest,
};

/// @relates flatten_strategy
RELAY_CORE_EXPORT std::string to_string(flatten_strategy x);

} // namespace relay
