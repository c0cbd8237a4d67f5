// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#pragma once

#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "relay/detail/core_export.hpp"
#include "relay/fwd.hpp"

namespace relay {

/// Discriminates the alternatives of an `event`.
enum class event_kind {
  next,
  error,
  completed,
  interrupted,
};

/// @relates event_kind
RELAY_CORE_EXPORT std::string to_string(event_kind x);

/// Carries a single value of a signal.
template <class T>
struct next_event {
  T value;
};

/// Terminates a signal with an error.
template <class E>
struct error_event {
  E reason;
};

/// Terminates a signal successfully.
struct completed_event {};

/// Terminates a signal after cancellation.
struct interrupted_event {};

/// A single event of a `signal`: either a value or one of the three terminal
/// markers error, completed and interrupted.
template <class T, class E>
class event {
public:
  // -- member types -----------------------------------------------------------

  using value_type = T;

  using error_type = E;

  using content_type = std::variant<next_event<T>, error_event<E>,
                                    completed_event, interrupted_event>;

  // -- constructors, destructors, and assignment operators --------------------

  event(next_event<T> x) : content_(std::move(x)) {
    // nop
  }

  event(error_event<E> x) : content_(std::move(x)) {
    // nop
  }

  event(completed_event x) : content_(x) {
    // nop
  }

  event(interrupted_event x) : content_(x) {
    // nop
  }

  event(const event&) = default;

  event(event&&) = default;

  event& operator=(const event&) = default;

  event& operator=(event&&) = default;

  // -- factories --------------------------------------------------------------

  static event make_next(T value) {
    return event{next_event<T>{std::move(value)}};
  }

  static event make_error(E reason) {
    return event{error_event<E>{std::move(reason)}};
  }

  static event make_completed() {
    return event{completed_event{}};
  }

  static event make_interrupted() {
    return event{interrupted_event{}};
  }

  // -- properties -------------------------------------------------------------

  event_kind kind() const noexcept {
    return static_cast<event_kind>(content_.index());
  }

  /// Returns whether this event ends its signal.
  bool is_terminating() const noexcept {
    return kind() != event_kind::next;
  }

  bool is_next() const noexcept {
    return kind() == event_kind::next;
  }

  bool is_error() const noexcept {
    return kind() == event_kind::error;
  }

  bool is_completed() const noexcept {
    return kind() == event_kind::completed;
  }

  bool is_interrupted() const noexcept {
    return kind() == event_kind::interrupted;
  }

  /// Returns a pointer to the value of a next event or `nullptr`.
  const T* value() const noexcept {
    if (auto ptr = std::get_if<next_event<T>>(&content_))
      return &ptr->value;
    return nullptr;
  }

  /// Returns a pointer to the reason of an error event or `nullptr`.
  const E* reason() const noexcept {
    if (auto ptr = std::get_if<error_event<E>>(&content_))
      return &ptr->reason;
    return nullptr;
  }

  const content_type& content() const noexcept {
    return content_;
  }

  // -- transformations --------------------------------------------------------

  /// Applies `f` to the value of a next event and keeps any other event.
  template <class F>
  auto map(F&& f) const {
    using value_t = std::decay_t<std::invoke_result_t<F, const T&>>;
    using result_t = event<value_t, E>;
    switch (kind()) {
      case event_kind::next:
        return result_t::make_next(f(*value()));
      case event_kind::error:
        return result_t::make_error(*reason());
      case event_kind::completed:
        return result_t::make_completed();
      case event_kind::interrupted:
        break;
    }
    return result_t::make_interrupted();
  }

  /// Applies `f` to the reason of an error event and keeps any other event.
  template <class F>
  auto map_error(F&& f) const {
    using error_t = std::decay_t<std::invoke_result_t<F, const E&>>;
    using result_t = event<T, error_t>;
    switch (kind()) {
      case event_kind::next:
        return result_t::make_next(*value());
      case event_kind::error:
        return result_t::make_error(f(*reason()));
      case event_kind::completed:
        return result_t::make_completed();
      case event_kind::interrupted:
        break;
    }
    return result_t::make_interrupted();
  }

  // -- visitation -------------------------------------------------------------

  /// Dispatches on the alternative. `f` must accept `next_event<T>`,
  /// `error_event<E>`, `completed_event` and `interrupted_event`.
  template <class F>
  decltype(auto) visit(F&& f) const {
    return std::visit(std::forward<F>(f), content_);
  }

private:
  content_type content_;
};

/// @relates event
template <class T, class E>
bool operator==(const event<T, E>& x, const event<T, E>& y) {
  if (x.kind() != y.kind())
    return false;
  switch (x.kind()) {
    case event_kind::next:
      return *x.value() == *y.value();
    case event_kind::error:
      return *x.reason() == *y.reason();
    case event_kind::completed:
    case event_kind::interrupted:
      break;
  }
  return true;
}

/// @relates event
template <class T, class E>
bool operator!=(const event<T, E>& x, const event<T, E>& y) {
  return !(x == y);
}

} // namespace relay
