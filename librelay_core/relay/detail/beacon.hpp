// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#pragma once

#include <condition_variable>
#include <mutex>

#include "relay/action.hpp"
#include "relay/detail/core_export.hpp"

namespace relay::detail {

/// A one-shot gate for blocking a thread until another thread runs the
/// beacon. Disposing the beacon releases waiting threads as well.
class RELAY_CORE_EXPORT beacon : public action::impl {
public:
  enum class state {
    waiting,
    lit,
    disposed,
  };

  void dispose() override;

  bool disposed() const noexcept override;

  action::state current_state() const noexcept override;

  /// Lights the beacon and wakes up all waiting threads.
  void run() override;

  /// Blocks the calling thread until the beacon is either lit or disposed.
  [[nodiscard]] state wait() {
    std::unique_lock guard{mtx_};
    cv_.wait(guard, [this] { return state_ != state::waiting; });
    return state_;
  }

  template <class Duration>
  [[nodiscard]] state wait_for(Duration timeout) {
    std::unique_lock guard{mtx_};
    cv_.wait_for(guard, timeout, [this] { return state_ != state::waiting; });
    return state_;
  }

private:
  mutable std::mutex mtx_;
  std::condition_variable cv_;
  state state_ = state::waiting;
};

} // namespace relay::detail
