// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#pragma once

#include <string>

namespace relay {

/// Error type for producers and signals that never fail. Operators that
/// require a failing type, e.g. `promote_errors`, accept `no_error` as
/// input error type.
struct no_error {};

/// @relates no_error
constexpr bool operator==(no_error, no_error) noexcept {
  return true;
}

/// @relates no_error
constexpr bool operator!=(no_error, no_error) noexcept {
  return false;
}

/// @relates no_error
inline std::string to_string(no_error) {
  return "no_error";
}

} // namespace relay
