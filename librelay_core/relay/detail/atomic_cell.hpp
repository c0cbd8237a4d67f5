// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#pragma once

#include <mutex>
#include <utility>

namespace relay::detail {

/// A value guarded by a mutex. All mutations run as a single critical section
/// and report the state the value had before the mutation.
template <class T>
class atomic_cell {
public:
  using value_type = T;

  atomic_cell() = default;

  explicit atomic_cell(T value) : value_(std::move(value)) {
    // nop
  }

  atomic_cell(const atomic_cell&) = delete;

  atomic_cell& operator=(const atomic_cell&) = delete;

  /// Applies `f` to the stored value and returns the value before the
  /// modification.
  template <class F>
  T modify(F&& f) {
    std::unique_lock guard{mtx_};
    auto old = value_;
    f(value_);
    return old;
  }

  /// Applies `f` to the stored value and returns the result of `f`.
  template <class F>
  decltype(auto) with_value(F&& f) {
    std::unique_lock guard{mtx_};
    return f(value_);
  }

  /// Replaces the stored value and returns the previous one.
  T exchange(T value) {
    std::unique_lock guard{mtx_};
    std::swap(value, value_);
    return value;
  }

  T load() const {
    std::unique_lock guard{mtx_};
    return value_;
  }

private:
  mutable std::mutex mtx_;
  T value_;
};

} // namespace relay::detail
