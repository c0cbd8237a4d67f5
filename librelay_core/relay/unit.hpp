// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#pragma once

#include <string>

namespace relay {

/// Unit is analogous to `void`, but can be safely returned, stored, etc.
/// to enable higher-order abstraction without cluttering code with
/// exceptions for `void` (which can't be stored, for example).
struct unit_t {
  constexpr unit_t() noexcept = default;

  constexpr unit_t(const unit_t&) noexcept = default;

  constexpr unit_t& operator=(const unit_t&) noexcept = default;

  template <class... Ts>
  constexpr unit_t operator()(Ts&&...) const noexcept {
    return {};
  }
};

static constexpr unit_t unit = unit_t{};

/// @relates unit_t
constexpr bool operator==(unit_t, unit_t) noexcept {
  return true;
}

/// @relates unit_t
constexpr bool operator!=(unit_t, unit_t) noexcept {
  return false;
}

/// @relates unit_t
inline std::string to_string(unit_t) {
  return "unit";
}

} // namespace relay
