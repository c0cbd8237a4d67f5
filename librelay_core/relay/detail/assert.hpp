// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#pragma once

#include "relay/detail/build_config.hpp"
#include "relay/detail/core_export.hpp"

namespace relay::detail {

[[noreturn]] RELAY_CORE_EXPORT void assertion_failed(const char* file, int line,
                                                     const char* stmt);

} // namespace relay::detail

#ifdef RELAY_ENABLE_RUNTIME_CHECKS
#  define RELAY_ASSERT(stmt)                                                   \
    if (static_cast<bool>(stmt) == false) {                                    \
      relay::detail::assertion_failed(__FILE__, __LINE__, #stmt);              \
    }                                                                          \
    static_cast<void>(0)
#else
#  define RELAY_ASSERT(unused) static_cast<void>(0)
#endif
