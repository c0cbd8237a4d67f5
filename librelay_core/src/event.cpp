// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#include "relay/event.hpp"

namespace relay {

std::string to_string(event_kind x) {
  switch (x) {
    default:
      return "???";
    case event_kind::next:
      return "next";
    case event_kind::error:
      return "error";
    case event_kind::completed:
      return "completed";
    case event_kind::interrupted:
      return "interrupted";
  }
}

} // namespace relay
