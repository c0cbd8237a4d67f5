// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#include "relay/raise_error.hpp"

#include "relay/logger.hpp"

namespace relay::detail {

void log_raised_error(const char* file, int line, const char* msg) {
  if (auto instance = logger::current_logger();
      instance && instance->accepts(RELAY_LOG_LEVEL_ERROR, "relay"))
    instance->log(RELAY_LOG_LEVEL_ERROR, "relay", file, line, msg);
}

} // namespace relay::detail
