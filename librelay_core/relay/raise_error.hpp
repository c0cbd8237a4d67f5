// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#pragma once

#include <stdexcept>
#include <type_traits>

#include "relay/detail/core_export.hpp"

namespace relay::detail {

/// Writes `msg` to the current logger with component "relay" at error level.
RELAY_CORE_EXPORT void log_raised_error(const char* file, int line,
                                        const char* msg);

template <class T>
[[noreturn]] std::enable_if_t<std::is_constructible_v<T, const char*>>
throw_impl(const char* msg) {
  throw T{msg};
}

template <class T>
[[noreturn]] void throw_impl(...) {
  throw T{};
}

} // namespace relay::detail

#define RELAY_RAISE_ERROR_IMPL_2(exception_type, msg)                          \
  do {                                                                         \
    ::relay::detail::log_raised_error(__FILE__, __LINE__, msg);                \
    ::relay::detail::throw_impl<exception_type>(msg);                          \
  } while (false)

#define RELAY_RAISE_ERROR_IMPL_1(msg)                                          \
  RELAY_RAISE_ERROR_IMPL_2(std::runtime_error, msg)

#define RELAY_RAISE_ERROR_SELECT(_1, _2, name, ...) name

/// Logs `msg` and throws an exception of the given type, defaulting to
/// `std::runtime_error`. Usage: `RELAY_RAISE_ERROR(msg)` or
/// `RELAY_RAISE_ERROR(exception_type, msg)`.
#define RELAY_RAISE_ERROR(...)                                                 \
  RELAY_RAISE_ERROR_SELECT(__VA_ARGS__, RELAY_RAISE_ERROR_IMPL_2,              \
                           RELAY_RAISE_ERROR_IMPL_1, unused)                   \
  (__VA_ARGS__)
