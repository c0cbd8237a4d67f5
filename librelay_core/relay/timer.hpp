// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#pragma once

#include "relay/detail/core_export.hpp"
#include "relay/fwd.hpp"
#include "relay/no_error.hpp"
#include "relay/producer.hpp"
#include "relay/timestamp.hpp"

namespace relay {

/// Emits the current time of `sched` every `interval`. Never completes.
/// The scheduler may delay each value by up to `leeway`.
/// @pre `interval > 0 && leeway >= 0`
RELAY_CORE_EXPORT producer<timestamp, no_error>
timer(timespan interval, date_scheduler_ptr sched, timespan leeway);

/// Emits the current time of `sched` every `interval` with a leeway of
/// `interval / defaults::timer::leeway_divisor`.
RELAY_CORE_EXPORT producer<timestamp, no_error>
timer(timespan interval, date_scheduler_ptr sched);

} // namespace relay
