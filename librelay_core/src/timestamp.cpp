// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#include "relay/timestamp.hpp"

namespace relay {

timestamp make_timestamp() {
  return std::chrono::time_point_cast<timespan>(
    std::chrono::system_clock::now());
}

std::string timestamp_to_string(timestamp x) {
  return std::to_string(x.time_since_epoch().count()) + "ns";
}

} // namespace relay
