// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#pragma once

#include <type_traits>
#include <utility>

#include "relay/event.hpp"
#include "relay/intrusive_ptr.hpp"
#include "relay/make_counted.hpp"
#include "relay/ref_counted.hpp"
#include "relay/unit.hpp"

namespace relay {

/// Handle to a consumer of events.
template <class T, class E>
class observer {
public:
  // -- member types -----------------------------------------------------------

  using value_type = T;

  using error_type = E;

  using event_type = event<T, E>;

  /// Internal interface of an `observer`.
  class impl : public virtual ref_counted {
  public:
    using value_type = T;

    using error_type = E;

    virtual void on_event(const event_type& what) = 0;

    observer as_observer() {
      return observer{intrusive_ptr<impl>(this)};
    }
  };

  // -- constructors, destructors, and assignment operators --------------------

  explicit observer(intrusive_ptr<impl> pimpl) noexcept
    : pimpl_(std::move(pimpl)) {
    // nop
  }

  observer& operator=(std::nullptr_t) noexcept {
    pimpl_.reset();
    return *this;
  }

  observer() noexcept = default;

  observer(observer&&) noexcept = default;

  observer(const observer&) noexcept = default;

  observer& operator=(observer&&) noexcept = default;

  observer& operator=(const observer&) noexcept = default;

  // -- sending events ---------------------------------------------------------

  /// @pre `valid()`
  void on_event(const event_type& what) const {
    pimpl_->on_event(what);
  }

  /// @pre `valid()`
  void on_next(T value) const {
    pimpl_->on_event(event_type::make_next(std::move(value)));
  }

  /// @pre `valid()`
  void on_error(E reason) const {
    pimpl_->on_event(event_type::make_error(std::move(reason)));
  }

  /// @pre `valid()`
  void on_completed() const {
    pimpl_->on_event(event_type::make_completed());
  }

  /// @pre `valid()`
  void on_interrupted() const {
    pimpl_->on_event(event_type::make_interrupted());
  }

  // -- factories --------------------------------------------------------------

  /// Creates a new observer from `Impl`.
  template <class Impl, class... Ts>
  [[nodiscard]] static observer make(Ts&&... xs) {
    static_assert(std::is_base_of_v<impl, Impl>);
    return observer{make_counted<Impl>(std::forward<Ts>(xs)...)};
  }

  // -- properties -------------------------------------------------------------

  bool valid() const noexcept {
    return pimpl_ != nullptr;
  }

  explicit operator bool() const noexcept {
    return valid();
  }

  bool operator!() const noexcept {
    return !valid();
  }

  impl* ptr() const noexcept {
    return pimpl_.get();
  }

  const intrusive_ptr<impl>& as_intrusive_ptr() const& noexcept {
    return pimpl_;
  }

  intrusive_ptr<impl>&& as_intrusive_ptr() && noexcept {
    return std::move(pimpl_);
  }

  void swap(observer& other) noexcept {
    pimpl_.swap(other.pimpl_);
  }

private:
  intrusive_ptr<impl> pimpl_;
};

// -- observers from function objects ------------------------------------------

namespace detail {

/// Forwards each event to a function object.
template <class T, class E, class F>
class event_observer_impl : public observer<T, E>::impl {
public:
  static_assert(std::is_invocable_v<F&, const event<T, E>&>);

  explicit event_observer_impl(F fn) : fn_(std::move(fn)) {
    // nop
  }

  void on_event(const event<T, E>& what) override {
    fn_(what);
  }

private:
  F fn_;
};

/// Dispatches each event to one of four callbacks.
template <class T, class E, class OnNext, class OnError = unit_t,
          class OnCompleted = unit_t, class OnInterrupted = unit_t>
class default_observer_impl : public observer<T, E>::impl {
public:
  static_assert(std::is_invocable_v<OnNext&, const T&>);

  static_assert(std::is_invocable_v<OnError&, const E&>);

  static_assert(std::is_invocable_v<OnCompleted&>);

  static_assert(std::is_invocable_v<OnInterrupted&>);

  default_observer_impl(OnNext on_next_fn, OnError on_error_fn,
                        OnCompleted on_completed_fn,
                        OnInterrupted on_interrupted_fn)
    : on_next_(std::move(on_next_fn)),
      on_error_(std::move(on_error_fn)),
      on_completed_(std::move(on_completed_fn)),
      on_interrupted_(std::move(on_interrupted_fn)) {
    // nop
  }

  void on_event(const event<T, E>& what) override {
    switch (what.kind()) {
      case event_kind::next:
        on_next_(*what.value());
        break;
      case event_kind::error:
        on_error_(*what.reason());
        break;
      case event_kind::completed:
        on_completed_();
        break;
      case event_kind::interrupted:
        on_interrupted_();
        break;
    }
  }

private:
  OnNext on_next_;
  OnError on_error_;
  OnCompleted on_completed_;
  OnInterrupted on_interrupted_;
};

} // namespace detail

/// Creates an observer that calls `f` for each event.
/// @relates observer
template <class T, class E, class F>
observer<T, E> make_event_observer(F f) {
  using impl_type = detail::event_observer_impl<T, E, F>;
  return observer<T, E>{make_counted<impl_type>(std::move(f))};
}

/// Creates an observer from up to four callbacks. Omitted callbacks do
/// nothing.
/// @relates observer
template <class T, class E, class OnNext, class OnError = unit_t,
          class OnCompleted = unit_t, class OnInterrupted = unit_t>
observer<T, E> make_observer(OnNext on_next, OnError on_error = {},
                             OnCompleted on_completed = {},
                             OnInterrupted on_interrupted = {}) {
  using impl_type = detail::default_observer_impl<T, E, OnNext, OnError,
                                                  OnCompleted, OnInterrupted>;
  auto ptr = make_counted<impl_type>(std::move(on_next), std::move(on_error),
                                     std::move(on_completed),
                                     std::move(on_interrupted));
  return observer<T, E>{std::move(ptr)};
}

} // namespace relay
