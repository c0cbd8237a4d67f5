// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#pragma once

#include <atomic>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

#include "relay/disposable.hpp"
#include "relay/event.hpp"
#include "relay/no_error.hpp"
#include "relay/observer.hpp"
#include "relay/result.hpp"
#include "relay/unit.hpp"

// Steps are the building blocks for unary signal operators. A step receives
// the input events of a signal and writes output events into a sink. The
// `on_next` handler returns `false` after the step terminated its output,
// which causes the signal to stop observing its input.

namespace relay {

/// Forwards all terminal events unchanged. Base type for steps that only
/// operate on values.
struct forwarding_step {
  template <class Reason, class Sink>
  void on_error(const Reason& what, const Sink& out) {
    out.on_error(what);
  }

  template <class Sink>
  void on_completed(const Sink& out) {
    out.on_completed();
  }

  template <class Sink>
  void on_interrupted(const Sink& out) {
    out.on_interrupted();
  }
};

template <class T, class E, class F>
struct map_step : forwarding_step {
  using input_type = T;

  using output_type = std::decay_t<std::invoke_result_t<F&, const T&>>;

  using error_type = E;

  using output_error_type = E;

  F fn;

  template <class Sink>
  bool on_next(const T& x, const Sink& out) {
    out.on_next(fn(x));
    return true;
  }
};

template <class T, class E, class F>
struct map_error_step : forwarding_step {
  using input_type = T;

  using output_type = T;

  using error_type = E;

  using output_error_type = std::decay_t<std::invoke_result_t<F&, const E&>>;

  F fn;

  template <class Sink>
  bool on_next(const T& x, const Sink& out) {
    out.on_next(x);
    return true;
  }

  template <class Sink>
  void on_error(const E& what, const Sink& out) {
    out.on_error(fn(what));
  }
};

template <class T, class E, class Predicate>
struct filter_step : forwarding_step {
  using input_type = T;

  using output_type = T;

  using error_type = E;

  using output_error_type = E;

  Predicate predicate;

  template <class Sink>
  bool on_next(const T& x, const Sink& out) {
    if (predicate(x))
      out.on_next(x);
    return true;
  }
};

/// Forwards the first `remaining` values, then completes.
/// @pre `remaining > 0`
template <class T, class E>
struct take_step : forwarding_step {
  using input_type = T;

  using output_type = T;

  using error_type = E;

  using output_error_type = E;

  size_t remaining;

  template <class Sink>
  bool on_next(const T& x, const Sink& out) {
    out.on_next(x);
    if (--remaining == 0) {
      out.on_completed();
      return false;
    }
    return true;
  }
};

template <class T, class E>
struct skip_step : forwarding_step {
  using input_type = T;

  using output_type = T;

  using error_type = E;

  using output_error_type = E;

  size_t remaining;

  template <class Sink>
  bool on_next(const T& x, const Sink& out) {
    if (remaining > 0)
      --remaining;
    else
      out.on_next(x);
    return true;
  }
};

template <class T, class E, class Predicate>
struct take_while_step : forwarding_step {
  using input_type = T;

  using output_type = T;

  using error_type = E;

  using output_error_type = E;

  Predicate predicate;

  template <class Sink>
  bool on_next(const T& x, const Sink& out) {
    if (predicate(x)) {
      out.on_next(x);
      return true;
    }
    out.on_completed();
    return false;
  }
};

template <class T, class E, class Predicate>
struct skip_while_step : forwarding_step {
  using input_type = T;

  using output_type = T;

  using error_type = E;

  using output_error_type = E;

  Predicate predicate;

  bool skipping = true;

  template <class Sink>
  bool on_next(const T& x, const Sink& out) {
    if (skipping && predicate(x))
      return true;
    skipping = false;
    out.on_next(x);
    return true;
  }
};

/// Buffers the last `count` values and emits them on completion.
template <class T, class E>
struct take_last_step : forwarding_step {
  using input_type = T;

  using output_type = T;

  using error_type = E;

  using output_error_type = E;

  size_t count;

  std::deque<T> buf;

  template <class Sink>
  bool on_next(const T& x, const Sink&) {
    if (count == 0)
      return true;
    buf.push_back(x);
    if (buf.size() > count)
      buf.pop_front();
    return true;
  }

  template <class Sink>
  void on_completed(const Sink& out) {
    for (auto& x : buf)
      out.on_next(x);
    buf.clear();
    out.on_completed();
  }
};

template <class T, class E, class U, class F>
struct scan_step : forwarding_step {
  using input_type = T;

  using output_type = U;

  using error_type = E;

  using output_error_type = E;

  U accumulator;

  F fn;

  template <class Sink>
  bool on_next(const T& x, const Sink& out) {
    accumulator = fn(accumulator, x);
    out.on_next(accumulator);
    return true;
  }
};

/// Like `scan_step`, but only emits the final value on completion.
template <class T, class E, class U, class F>
struct reduce_step : forwarding_step {
  using input_type = T;

  using output_type = U;

  using error_type = E;

  using output_error_type = E;

  U accumulator;

  F fn;

  template <class Sink>
  bool on_next(const T& x, const Sink&) {
    accumulator = fn(accumulator, x);
    return true;
  }

  template <class Sink>
  void on_completed(const Sink& out) {
    out.on_next(accumulator);
    out.on_completed();
  }
};

/// Collects all values and emits them as a single `std::vector` on
/// completion. Emits an empty vector if the input completes without values.
template <class T, class E>
struct collect_step : forwarding_step {
  using input_type = T;

  using output_type = std::vector<T>;

  using error_type = E;

  using output_error_type = E;

  std::vector<T> values;

  template <class Sink>
  bool on_next(const T& x, const Sink&) {
    values.push_back(x);
    return true;
  }

  template <class Sink>
  void on_completed(const Sink& out) {
    out.on_next(std::move(values));
    out.on_completed();
  }
};

/// Drops values that are equivalent to their predecessor according to
/// `Predicate`.
template <class T, class E, class Predicate = std::equal_to<T>>
struct skip_repeats_step : forwarding_step {
  using input_type = T;

  using output_type = T;

  using error_type = E;

  using output_error_type = E;

  Predicate predicate;

  std::optional<T> previous;

  template <class Sink>
  bool on_next(const T& x, const Sink& out) {
    if (previous && predicate(*previous, x))
      return true;
    previous = x;
    out.on_next(x);
    return true;
  }
};

/// Emits each value paired with its predecessor. Without an initial value,
/// the first input value only becomes the predecessor of the second one.
template <class T, class E>
struct combine_previous_step : forwarding_step {
  using input_type = T;

  using output_type = std::pair<T, T>;

  using error_type = E;

  using output_error_type = E;

  std::optional<T> previous;

  template <class Sink>
  bool on_next(const T& x, const Sink& out) {
    if (previous)
      out.on_next(output_type{*previous, x});
    previous = x;
    return true;
  }
};

/// Wraps every event, including terminal events, into a value.
template <class T, class E>
struct materialize_step {
  using input_type = T;

  using output_type = event<T, E>;

  using error_type = E;

  using output_error_type = no_error;

  template <class Sink>
  bool on_next(const T& x, const Sink& out) {
    out.on_next(output_type::make_next(x));
    return true;
  }

  template <class Sink>
  void on_error(const E& what, const Sink& out) {
    out.on_next(output_type::make_error(what));
    out.on_completed();
  }

  template <class Sink>
  void on_completed(const Sink& out) {
    out.on_next(output_type::make_completed());
    out.on_completed();
  }

  template <class Sink>
  void on_interrupted(const Sink& out) {
    out.on_next(output_type::make_interrupted());
    out.on_interrupted();
  }
};

/// Inverse of `materialize_step`: unwraps events from values.
template <class T, class E>
struct dematerialize_step : forwarding_step {
  using input_type = event<T, E>;

  using output_type = T;

  using error_type = no_error;

  using output_error_type = E;

  template <class Sink>
  bool on_next(const input_type& x, const Sink& out) {
    out.on_event(x);
    return !x.is_terminating();
  }

  template <class Sink>
  void on_error(const no_error&, const Sink&) {
    // nop
  }
};

/// Drops empty optionals and unwraps all others.
template <class T, class E>
struct ignore_nil_step : forwarding_step {
  using input_type = std::optional<T>;

  using output_type = T;

  using error_type = E;

  using output_error_type = E;

  template <class Sink>
  bool on_next(const input_type& x, const Sink& out) {
    if (x)
      out.on_next(*x);
    return true;
  }
};

/// Changes the error type of a signal that never fails.
template <class T, class E>
struct promote_errors_step : forwarding_step {
  using input_type = T;

  using output_type = T;

  using error_type = no_error;

  using output_error_type = E;

  template <class Sink>
  bool on_next(const T& x, const Sink& out) {
    out.on_next(x);
    return true;
  }

  template <class Sink>
  void on_error(const no_error&, const Sink&) {
    // nop
  }
};

/// Forwards values for which `fn` succeeds and fails with the first error.
template <class T, class E, class F>
struct attempt_step : forwarding_step {
  using input_type = T;

  using output_type = T;

  using error_type = E;

  using output_error_type = E;

  F fn;

  template <class Sink>
  bool on_next(const T& x, const Sink& out) {
    auto res = fn(x);
    if (!res) {
      out.on_error(res.error());
      return false;
    }
    out.on_next(x);
    return true;
  }
};

/// Maps values with `fn` and fails with the first error.
template <class T, class E, class F>
struct attempt_map_step : forwarding_step {
  using input_type = T;

  using output_type =
    typename std::decay_t<std::invoke_result_t<F&, const T&>>::value_type;

  using error_type = E;

  using output_error_type = E;

  F fn;

  template <class Sink>
  bool on_next(const T& x, const Sink& out) {
    auto res = fn(x);
    if (!res) {
      out.on_error(res.error());
      return false;
    }
    out.on_next(std::move(res.value()));
    return true;
  }
};

} // namespace relay

namespace relay::detail {

/// Observes the input of a step and writes its output to a sink.
template <class Step>
class step_observer
  : public observer<typename Step::input_type, typename Step::error_type>::impl {
public:
  using input_type = typename Step::input_type;

  using error_type = typename Step::error_type;

  using sink_type
    = observer<typename Step::output_type, typename Step::output_error_type>;

  step_observer(Step step, sink_type out)
    : step_(std::move(step)), out_(std::move(out)) {
    // nop
  }

  void on_event(const event<input_type, error_type>& what) override {
    if (done_)
      return;
    switch (what.kind()) {
      case event_kind::next:
        if (!step_.on_next(*what.value(), out_))
          finish();
        break;
      case event_kind::error:
        done_ = true;
        step_.on_error(*what.reason(), out_);
        break;
      case event_kind::completed:
        done_ = true;
        step_.on_completed(out_);
        break;
      case event_kind::interrupted:
        done_ = true;
        step_.on_interrupted(out_);
        break;
    }
  }

  /// Stores the observation of the input. Disposes `sub` immediately if the
  /// step already terminated its output.
  void set_upstream(disposable sub) {
    {
      std::unique_lock guard{mtx_};
      if (!done_) {
        upstream_ = std::move(sub);
        return;
      }
    }
    sub.dispose();
  }

private:
  void finish() {
    done_ = true;
    disposable sub;
    {
      std::unique_lock guard{mtx_};
      sub.swap(upstream_);
    }
    sub.dispose();
  }

  Step step_;
  sink_type out_;
  std::atomic<bool> done_{false};
  std::mutex mtx_;
  disposable upstream_;
};

} // namespace relay::detail
