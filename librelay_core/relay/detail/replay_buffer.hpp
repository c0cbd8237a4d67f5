// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include "relay/detail/bag.hpp"
#include "relay/disposable.hpp"
#include "relay/event.hpp"
#include "relay/observer.hpp"
#include "relay/ref_counted.hpp"

namespace relay::detail {

/// Stores up to `capacity` non-terminal events plus the terminal event and
/// replays them to each observer that joins later.
template <class T, class E>
class replay_buffer : public ref_counted {
public:
  using event_type = event<T, E>;

  using observer_type = observer<T, E>;

  using token = typename bag<observer_type>::token;

  explicit replay_buffer(size_t capacity)
    : capacity_(capacity), observers_(std::in_place) {
    // nop
  }

  /// Records `what` and forwards it to all current observers. Drops events
  /// after the terminal event.
  void push(const event_type& what) {
    std::unique_lock guard{mtx_};
    if (terminal_)
      return;
    std::vector<observer_type> targets;
    if (what.is_terminating()) {
      terminal_ = what;
      targets = observers_->take_values();
      observers_.reset();
    } else {
      log_.push_back(what);
      while (log_.size() > capacity_)
        log_.pop_front();
      targets = observers_->values();
    }
    for (auto& target : targets)
      target.on_event(what);
  }

  /// Replays the history to `what` and adds it to the live observers unless
  /// the terminal event was already recorded. Returns the removal token if
  /// `what` joined the live observers.
  std::optional<token> attach(observer_type what) {
    std::unique_lock guard{mtx_};
    std::optional<token> result;
    if (observers_)
      result = observers_->insert(what);
    for (auto& x : log_)
      what.on_event(x);
    if (terminal_)
      what.on_event(*terminal_);
    return result;
  }

  void detach(token key) {
    std::optional<observer_type> removed;
    std::unique_lock guard{mtx_};
    if (observers_)
      removed = observers_->extract(key);
    guard.unlock();
  }

  /// Returns the number of stored non-terminal events.
  size_t size() const {
    std::unique_lock guard{mtx_};
    return log_.size();
  }

private:
  // Recursive, because observers may feed the buffer while receiving events.
  mutable std::recursive_mutex mtx_;
  size_t capacity_;
  std::deque<event_type> log_;
  std::optional<event_type> terminal_;
  std::optional<bag<observer_type>> observers_;
};

} // namespace relay::detail
