// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#include "relay/scheduler.hpp"

#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>

#include "relay/logger.hpp"
#include "relay/make_counted.hpp"
#include "relay/raise_error.hpp"

namespace relay {

// -- scheduler ----------------------------------------------------------------

scheduler::~scheduler() {
  // nop
}

date_scheduler::~date_scheduler() {
  // nop
}

// -- immediate_scheduler ------------------------------------------------------

immediate_scheduler::~immediate_scheduler() {
  // nop
}

disposable immediate_scheduler::schedule(action what) {
  what.run();
  return {};
}

scheduler_ptr immediate_scheduler::make() {
  return make_counted<immediate_scheduler>();
}

// -- queue_scheduler ----------------------------------------------------------

/// State shared between a `queue_scheduler` and its worker thread. Lives as
/// long as either of them.
class queue_scheduler::worker_state : public ref_counted {
public:
  struct job {
    action what;
    timespan interval;
  };

  using key_type = std::pair<timestamp, uint64_t>;

  /// Enqueues a job. Returns `false` if the worker has been stopped.
  bool push(timestamp when, action what, timespan interval) {
    std::unique_lock guard{mtx_};
    if (stopped_)
      return false;
    jobs_.emplace(key_type{when, next_seq_++}, job{std::move(what), interval});
    cv_.notify_all();
    return true;
  }

  void stop() {
    std::map<key_type, job> dropped;
    {
      std::unique_lock guard{mtx_};
      stopped_ = true;
      dropped.swap(jobs_);
      cv_.notify_all();
    }
  }

  void run(const std::string& name) {
    RELAY_LOG_DEBUG("worker of" << name << "started");
    std::unique_lock guard{mtx_};
    for (;;) {
      if (stopped_)
        break;
      if (jobs_.empty()) {
        cv_.wait(guard);
        continue;
      }
      auto i = jobs_.begin();
      auto when = i->first.first;
      if (when > make_timestamp()) {
        cv_.wait_until(guard, when);
        continue;
      }
      auto next = std::move(i->second);
      jobs_.erase(i);
      guard.unlock();
      if (!next.what.disposed())
        next.what.run();
      guard.lock();
      if (next.interval.count() > 0 && !stopped_ && !next.what.disposed())
        jobs_.emplace(key_type{when + next.interval, next_seq_++},
                      std::move(next));
    }
    RELAY_LOG_DEBUG("worker of" << name << "stopped");
  }

private:
  std::mutex mtx_;
  std::condition_variable cv_;
  bool stopped_ = false;
  uint64_t next_seq_ = 0;
  std::map<key_type, job> jobs_;
};

queue_scheduler::queue_scheduler(std::string name)
  : name_(std::move(name)), state_(make_counted<worker_state>()) {
  thread_ = std::thread{[state{state_}, name{name_}] { state->run(name); }};
}

queue_scheduler::~queue_scheduler() {
  stop();
}

timestamp queue_scheduler::now() const {
  return make_timestamp();
}

disposable queue_scheduler::schedule(action what) {
  return schedule_after(now(), std::move(what));
}

disposable queue_scheduler::schedule_after(timestamp when, action what) {
  return schedule_after(when, timespan{0}, timespan{0}, std::move(what));
}

disposable queue_scheduler::schedule_after(timestamp when, timespan interval,
                                           timespan, action what) {
  auto result = what.as_disposable();
  if (!state_->push(when, std::move(what), interval))
    RELAY_RAISE_ERROR("queue_scheduler: cannot schedule after stop()");
  return result;
}

void queue_scheduler::stop() {
  state_->stop();
  if (thread_.joinable()) {
    // Stopping from within an action must not join the worker itself.
    if (thread_.get_id() == std::this_thread::get_id())
      thread_.detach();
    else
      thread_.join();
  }
}

intrusive_ptr<queue_scheduler> queue_scheduler::make(std::string name) {
  return make_counted<queue_scheduler>(std::move(name));
}

} // namespace relay
