// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#pragma once

#include "relay/action.hpp"
#include "relay/combine.hpp"
#include "relay/config.hpp"
#include "relay/defaults.hpp"
#include "relay/disposable.hpp"
#include "relay/event.hpp"
#include "relay/flatten_strategy.hpp"
#include "relay/fwd.hpp"
#include "relay/intrusive_ptr.hpp"
#include "relay/logger.hpp"
#include "relay/make_counted.hpp"
#include "relay/no_error.hpp"
#include "relay/observer.hpp"
#include "relay/producer.hpp"
#include "relay/raise_error.hpp"
#include "relay/ref_counted.hpp"
#include "relay/result.hpp"
#include "relay/scheduler.hpp"
#include "relay/signal.hpp"
#include "relay/step.hpp"
#include "relay/test_scheduler.hpp"
#include "relay/timer.hpp"
#include "relay/timestamp.hpp"
#include "relay/unit.hpp"
