// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#pragma once

#include <type_traits>
#include <utility>
#include <variant>

#include "relay/fwd.hpp"

namespace relay {

/// Holds either the outcome of a successful computation or an error.
template <class T, class E>
class result {
public:
  // -- member types -----------------------------------------------------------

  using value_type = T;

  using error_type = E;

  // -- constructors, destructors, and assignment operators --------------------

  template <class... Ts>
  explicit result(std::in_place_index_t<0> tag, Ts&&... xs)
    : content_(tag, std::forward<Ts>(xs)...) {
    // nop
  }

  template <class... Ts>
  explicit result(std::in_place_index_t<1> tag, Ts&&... xs)
    : content_(tag, std::forward<Ts>(xs)...) {
    // nop
  }

  result(const result&) = default;

  result(result&&) = default;

  result& operator=(const result&) = default;

  result& operator=(result&&) = default;

  // -- factories --------------------------------------------------------------

  static result success(T value) {
    return result{std::in_place_index<0>, std::move(value)};
  }

  static result failure(E reason) {
    return result{std::in_place_index<1>, std::move(reason)};
  }

  // -- properties -------------------------------------------------------------

  bool has_value() const noexcept {
    return content_.index() == 0;
  }

  explicit operator bool() const noexcept {
    return has_value();
  }

  bool operator!() const noexcept {
    return !has_value();
  }

  /// @pre `has_value()`
  const T& value() const {
    return std::get<0>(content_);
  }

  /// @pre `has_value()`
  T& value() {
    return std::get<0>(content_);
  }

  /// @pre `!has_value()`
  const E& error() const {
    return std::get<1>(content_);
  }

  /// @pre `!has_value()`
  E& error() {
    return std::get<1>(content_);
  }

  // -- dispatching ------------------------------------------------------------

  /// Calls either `on_success` with the value or `on_failure` with the error.
  template <class OnSuccess, class OnFailure>
  decltype(auto) match(OnSuccess&& on_success, OnFailure&& on_failure) const {
    if (has_value())
      return on_success(value());
    else
      return on_failure(error());
  }

  /// Applies `f` to the value of a successful result.
  template <class F>
  auto map(F&& f) const {
    using value_t = std::decay_t<std::invoke_result_t<F, const T&>>;
    using result_t = result<value_t, E>;
    if (has_value())
      return result_t::success(f(value()));
    else
      return result_t::failure(error());
  }

  /// Applies `f` to the error of a failed result.
  template <class F>
  auto map_error(F&& f) const {
    using error_t = std::decay_t<std::invoke_result_t<F, const E&>>;
    using result_t = result<T, error_t>;
    if (has_value())
      return result_t::success(value());
    else
      return result_t::failure(f(error()));
  }

  const std::variant<T, E>& content() const noexcept {
    return content_;
  }

private:
  std::variant<T, E> content_;
};

/// @relates result
template <class T, class E>
bool operator==(const result<T, E>& x, const result<T, E>& y) {
  return x.content() == y.content();
}

/// @relates result
template <class T, class E>
bool operator!=(const result<T, E>& x, const result<T, E>& y) {
  return !(x == y);
}

} // namespace relay
