// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#pragma once

#include <string>
#include <thread>
#include <utility>

#include "relay/action.hpp"
#include "relay/detail/core_export.hpp"
#include "relay/disposable.hpp"
#include "relay/fwd.hpp"
#include "relay/intrusive_ptr.hpp"
#include "relay/ref_counted.hpp"
#include "relay/timestamp.hpp"

namespace relay {

/// Runs actions on some execution context.
class RELAY_CORE_EXPORT scheduler : public virtual ref_counted {
public:
  ~scheduler() override;

  /// Schedules `what` for execution. Disposing the returned handle before
  /// the scheduler runs `what` prevents it from running.
  virtual disposable schedule(action what) = 0;

  /// Convenience function for scheduling a function object.
  template <class F>
  disposable schedule_fn(F&& what) {
    return schedule(make_action(std::forward<F>(what)));
  }
};

/// A scheduler that knows the current time and can run actions at a later
/// point in time.
class RELAY_CORE_EXPORT date_scheduler : public scheduler {
public:
  ~date_scheduler() override;

  /// Returns the current time of this scheduler.
  virtual timestamp now() const = 0;

  /// Schedules `what` to run once at `when`.
  virtual disposable schedule_after(timestamp when, action what) = 0;

  /// Schedules `what` to run at `when` and then once every `interval`
  /// until disposed. The scheduler may delay each run by up to `leeway`.
  virtual disposable schedule_after(timestamp when, timespan interval,
                                    timespan leeway, action what)
    = 0;

  /// Convenience function for scheduling a function object.
  template <class F>
  disposable schedule_fn_after(timestamp when, F&& what) {
    return schedule_after(when, make_action(std::forward<F>(what)));
  }
};

/// Runs each action immediately on the calling thread.
class RELAY_CORE_EXPORT immediate_scheduler : public scheduler {
public:
  ~immediate_scheduler() override;

  /// Runs `what` before returning. Always returns an invalid handle.
  disposable schedule(action what) override;

  static scheduler_ptr make();
};

/// Runs actions in FIFO order on a dedicated worker thread. Timed actions run
/// in the order of their due time.
class RELAY_CORE_EXPORT queue_scheduler : public date_scheduler {
public:
  class worker_state;

  explicit queue_scheduler(std::string name = "relay.queue");

  ~queue_scheduler() override;

  timestamp now() const override;

  disposable schedule(action what) override;

  disposable schedule_after(timestamp when, action what) override;

  disposable schedule_after(timestamp when, timespan interval, timespan leeway,
                            action what) override;

  /// Stops the worker thread after the currently running action and drops
  /// all pending actions. Scheduling work after calling `stop` raises an
  /// error.
  void stop();

  const std::string& name() const noexcept {
    return name_;
  }

  static intrusive_ptr<queue_scheduler> make(std::string name = "relay.queue");

private:
  std::string name_;
  intrusive_ptr<worker_state> state_;
  std::thread thread_;
};

} // namespace relay
