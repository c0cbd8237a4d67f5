// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#include "relay/test_scheduler.hpp"

#include <algorithm>

#include "relay/make_counted.hpp"

namespace relay {

test_scheduler::test_scheduler(timestamp start) : now_(start) {
  // nop
}

test_scheduler::~test_scheduler() {
  // nop
}

timestamp test_scheduler::now() const {
  std::unique_lock guard{mtx_};
  return now_;
}

disposable test_scheduler::schedule(action what) {
  return schedule_after(now(), std::move(what));
}

disposable test_scheduler::schedule_after(timestamp when, action what) {
  return schedule_after(when, timespan{0}, timespan{0}, std::move(what));
}

disposable test_scheduler::schedule_after(timestamp when, timespan interval,
                                          timespan, action what) {
  auto result = what.as_disposable();
  std::unique_lock guard{mtx_};
  jobs_.emplace(key_type{when, next_seq_++}, job{std::move(what), interval});
  return result;
}

void test_scheduler::advance() {
  advance_to(now());
}

void test_scheduler::advance_by(timespan amount) {
  advance_to(now() + amount);
}

void test_scheduler::advance_to(timestamp when) {
  while (run_next(when)) {
    // nop
  }
  std::unique_lock guard{mtx_};
  now_ = std::max(now_, when);
}

void test_scheduler::run() {
  for (;;) {
    timestamp next;
    {
      std::unique_lock guard{mtx_};
      if (jobs_.empty())
        return;
      next = jobs_.begin()->first.first;
    }
    advance_to(next);
  }
}

size_t test_scheduler::pending() const {
  std::unique_lock guard{mtx_};
  return jobs_.size();
}

intrusive_ptr<test_scheduler> test_scheduler::make(timestamp start) {
  return make_counted<test_scheduler>(start);
}

bool test_scheduler::run_next(timestamp limit) {
  std::unique_lock guard{mtx_};
  if (jobs_.empty())
    return false;
  auto i = jobs_.begin();
  auto when = i->first.first;
  if (when > limit)
    return false;
  auto next = std::move(i->second);
  jobs_.erase(i);
  now_ = std::max(now_, when);
  guard.unlock();
  if (next.what.disposed())
    return true;
  next.what.run();
  if (next.interval.count() > 0 && !next.what.disposed()) {
    guard.lock();
    jobs_.emplace(key_type{when + next.interval, next_seq_++}, std::move(next));
  }
  return true;
}

} // namespace relay
