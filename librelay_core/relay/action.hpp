// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#pragma once

#include <atomic>
#include <cstddef>
#include <optional>
#include <utility>

#include "relay/detail/assert.hpp"
#include "relay/detail/core_export.hpp"
#include "relay/disposable.hpp"
#include "relay/make_counted.hpp"

namespace relay {

/// A functional interface similar to `std::function<void()>` with dispose
/// semantics.
class RELAY_CORE_EXPORT action {
public:
  // -- member types -----------------------------------------------------------

  /// Describes the current state of an `action`.
  enum class state {
    scheduled,        /// The action is scheduled for execution.
    running,          /// The action is currently running in another thread.
    deferred_dispose, /// The action is currently running, and will be disposed.
    disposed,         /// The action may no longer run.
  };

  /// Internal interface of `action`.
  class RELAY_CORE_EXPORT impl : public disposable::impl {
  public:
    virtual state current_state() const noexcept = 0;

    /// Triggers the action unless it has been disposed.
    virtual void run() = 0;
  };

  using impl_ptr = intrusive_ptr<impl>;

  // -- constructors, destructors, and assignment operators --------------------

  explicit action(impl_ptr ptr) noexcept;

  action() noexcept = default;

  action(action&&) noexcept = default;

  action(const action&) noexcept = default;

  action& operator=(action&&) noexcept = default;

  action& operator=(const action&) noexcept = default;

  action& operator=(std::nullptr_t) noexcept {
    pimpl_ = nullptr;
    return *this;
  }

  // -- observers --------------------------------------------------------------

  [[nodiscard]] bool disposed() const {
    auto state = pimpl_->current_state();
    return state == state::disposed || state == state::deferred_dispose;
  }

  [[nodiscard]] bool scheduled() const {
    return !disposed();
  }

  // -- mutators ---------------------------------------------------------------

  /// Triggers the action.
  void run() const {
    pimpl_->run();
  }

  /// Cancel the action if it has not been invoked yet.
  void dispose() const {
    pimpl_->dispose();
  }

  // -- conversion -------------------------------------------------------------

  /// Returns a smart pointer to the implementation.
  [[nodiscard]] disposable as_disposable() && noexcept {
    return disposable{std::move(pimpl_)};
  }

  /// Returns a smart pointer to the implementation.
  [[nodiscard]] disposable as_disposable() const& noexcept {
    return disposable{pimpl_};
  }

  /// Returns a pointer to the implementation.
  [[nodiscard]] impl* ptr() const noexcept {
    return pimpl_.get();
  }

  explicit operator bool() const noexcept {
    return static_cast<bool>(pimpl_);
  }

  [[nodiscard]] bool operator!() const noexcept {
    return !pimpl_;
  }

private:
  impl_ptr pimpl_;
};

/// Checks whether two actions are equal by comparing their pointers.
inline bool operator==(const action& lhs, const action& rhs) noexcept {
  return lhs.ptr() == rhs.ptr();
}

/// Checks whether two actions are not equal by comparing their pointers.
inline bool operator!=(const action& lhs, const action& rhs) noexcept {
  return !(lhs == rhs);
}

} // namespace relay

namespace relay::detail {

template <class F>
class default_action_impl : public action::impl {
public:
  explicit default_action_impl(F fn)
    : state_(action::state::scheduled), f_(std::move(fn)) {
    // nop
  }

  ~default_action_impl() override {
    // The action going out of scope can't be running or deferred dispose.
    RELAY_ASSERT(state_.load() != action::state::running);
    RELAY_ASSERT(state_.load() != action::state::deferred_dispose);
  }

  void dispose() override {
    // Try changing the state to disposed
    for (;;) {
      if (auto expected = state_.load(); expected == action::state::scheduled) {
        if (state_.compare_exchange_weak(expected, action::state::disposed)) {
          f_.reset();
          return;
        }
      } else if (expected == action::state::running) {
        if (state_.compare_exchange_weak(expected,
                                         action::state::deferred_dispose))
          return;
      } else { // action::state::{deferred_dispose, disposed}
        return;
      }
    }
  }

  bool disposed() const noexcept override {
    auto current_state = state_.load();
    return current_state == action::state::disposed
           || current_state == action::state::deferred_dispose;
  }

  action::state current_state() const noexcept override {
    return state_.load();
  }

  void run() override {
    // We can only run a scheduled action.
    auto expected = action::state::scheduled;
    if (!state_.compare_exchange_strong(expected, action::state::running))
      return;
    (*f_)();
    // Once run, we can stay in the running state or switch to deferred dispose.
    expected = action::state::running;
    if (state_.compare_exchange_strong(expected, action::state::scheduled))
      return;
    RELAY_ASSERT(expected == action::state::deferred_dispose);
    state_ = action::state::disposed;
    f_.reset();
  }

private:
  std::atomic<action::state> state_;
  std::optional<F> f_;
};

} // namespace relay::detail

namespace relay {

/// Convenience function for creating an @ref action from a function object.
/// @param f The body for the action.
template <class F>
action make_action(F f) {
  using impl_t = detail::default_action_impl<F>;
  return action{make_counted<impl_t>(std::move(f))};
}

} // namespace relay
