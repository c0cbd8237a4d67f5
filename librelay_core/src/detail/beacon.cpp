// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#include "relay/detail/beacon.hpp"

namespace relay::detail {

void beacon::dispose() {
  std::unique_lock guard{mtx_};
  if (state_ == state::waiting) {
    state_ = state::disposed;
    cv_.notify_all();
  }
}

bool beacon::disposed() const noexcept {
  std::unique_lock guard{mtx_};
  return state_ == state::disposed;
}

action::state beacon::current_state() const noexcept {
  std::unique_lock guard{mtx_};
  switch (state_) {
    case state::waiting:
    case state::lit:
      return action::state::scheduled;
    case state::disposed:
      break;
  }
  return action::state::disposed;
}

void beacon::run() {
  std::unique_lock guard{mtx_};
  if (state_ == state::waiting) {
    state_ = state::lit;
    cv_.notify_all();
  }
}

} // namespace relay::detail
