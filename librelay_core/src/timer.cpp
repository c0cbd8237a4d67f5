// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#include "relay/timer.hpp"

#include <stdexcept>
#include <utility>

#include "relay/action.hpp"
#include "relay/defaults.hpp"
#include "relay/raise_error.hpp"
#include "relay/scheduler.hpp"

namespace relay {

producer<timestamp, no_error>
timer(timespan interval, date_scheduler_ptr sched, timespan leeway) {
  using producer_type = producer<timestamp, no_error>;
  using observer_type = producer_type::observer_type;
  // A repeating job with a zero interval would never leave the current
  // instant.
  if (interval.count() <= 0)
    RELAY_RAISE_ERROR(std::invalid_argument, "timer requires a positive "
                                             "interval");
  if (leeway.count() < 0)
    RELAY_RAISE_ERROR(std::invalid_argument, "timer with negative leeway");
  return producer_type::make([interval, leeway, sched{std::move(sched)}](
                               observer_type out, composite_disposable root) {
    auto tick = make_action([out, sched] { out.on_next(sched->now()); });
    root.add(sched->schedule_after(sched->now() + interval, interval, leeway,
                                   std::move(tick)));
  });
}

producer<timestamp, no_error> timer(timespan interval,
                                    date_scheduler_ptr sched) {
  auto leeway = interval / defaults::timer::leeway_divisor;
  return timer(interval, std::move(sched), leeway);
}

} // namespace relay
