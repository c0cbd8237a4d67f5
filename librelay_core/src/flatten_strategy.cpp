// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#include "relay/flatten_strategy.hpp"

namespace relay {

std::string to_string(flatten_strategy x) {
  switch (x) {
    default:
      return "???";
    case flatten_strategy::merge:
      return "merge";
    case flatten_strategy::concatenate:
      return "concatenate";
    case flatten_strategy::latest:
      return "latest";
  }
}

} // namespace relay
