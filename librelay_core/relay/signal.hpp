// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

#include "relay/detail/atomic_cell.hpp"
#include "relay/detail/bag.hpp"
#include "relay/disposable.hpp"
#include "relay/event.hpp"
#include "relay/fwd.hpp"
#include "relay/intrusive_ptr.hpp"
#include "relay/make_counted.hpp"
#include "relay/no_error.hpp"
#include "relay/observer.hpp"
#include "relay/raise_error.hpp"
#include "relay/ref_counted.hpp"
#include "relay/scheduler.hpp"
#include "relay/step.hpp"
#include "relay/timestamp.hpp"
#include "relay/unit.hpp"

namespace relay {

/// A hot, multicast stream of events. A signal delivers at most one terminal
/// event and drops all events after it. Observers that subscribe to a
/// terminated signal receive an interrupted event immediately.
template <class T, class E>
class signal {
public:
  // -- member types -----------------------------------------------------------

  using value_type = T;

  using error_type = E;

  using event_type = event<T, E>;

  using observer_type = observer<T, E>;

  /// Internal state of a signal. Serializes event delivery.
  class impl : public virtual ref_counted {
  public:
    using token = typename detail::bag<observer_type>::token;

    impl()
      : observers_(std::in_place), generator_(serial_disposable::make()) {
      // nop
    }

    /// Delivers `what` to all current observers.
    void send(const event_type& what) {
      std::unique_lock send_guard{send_mtx_};
      std::vector<observer_type> targets;
      {
        std::unique_lock guard{mtx_};
        if (!observers_)
          return;
        targets = observers_->values();
        if (what.is_terminating())
          observers_.reset();
      }
      if (what.is_terminating()) {
        for (auto& target : targets)
          target.on_event(what);
        generator_.dispose();
        return;
      }
      for (auto& target : targets) {
        // Stop if an observer terminated this signal while we are sending.
        if (!alive())
          return;
        target.on_event(what);
      }
    }

    disposable observe(observer_type what) {
      {
        std::unique_lock guard{mtx_};
        if (observers_) {
          auto key = observers_->insert(what);
          return make_disposable([ptr = intrusive_ptr<impl>{this}, key] {
            ptr->remove(key);
          });
        }
      }
      what.on_interrupted();
      return {};
    }

    void remove(token key) {
      std::optional<observer_type> removed;
      std::unique_lock guard{mtx_};
      if (observers_)
        removed = observers_->extract(key);
      guard.unlock();
    }

    /// Stores the disposable of the generator that feeds this signal.
    void set_generator(disposable what) {
      generator_.set(std::move(what));
      if (!alive())
        generator_.dispose();
    }

    bool alive() const {
      std::unique_lock guard{mtx_};
      return observers_.has_value();
    }

    size_t num_observers() const {
      std::unique_lock guard{mtx_};
      return observers_ ? observers_->size() : 0u;
    }

  private:
    std::recursive_mutex send_mtx_;
    mutable std::mutex mtx_;
    std::optional<detail::bag<observer_type>> observers_;
    serial_disposable generator_;
  };

  /// Sends all events into a signal.
  class sink_impl : public observer_type::impl {
  public:
    explicit sink_impl(intrusive_ptr<impl> target)
      : target_(std::move(target)) {
      // nop
    }

    void on_event(const event_type& what) override {
      target_->send(what);
    }

  private:
    intrusive_ptr<impl> target_;
  };

  // -- constructors, destructors, and assignment operators --------------------

  explicit signal(intrusive_ptr<impl> pimpl) noexcept
    : pimpl_(std::move(pimpl)) {
    // nop
  }

  signal() noexcept = default;

  signal(signal&&) noexcept = default;

  signal(const signal&) noexcept = default;

  signal& operator=(signal&&) noexcept = default;

  signal& operator=(const signal&) noexcept = default;

  // -- factories --------------------------------------------------------------

  /// Creates a signal and the observer for sending events into it.
  static std::pair<signal, observer_type> pipe() {
    auto core = make_counted<impl>();
    auto sink = make_counted<sink_impl>(core);
    return {signal{std::move(core)}, observer_type{std::move(sink)}};
  }

  /// Creates a signal that receives its events from `generator`. The
  /// generator receives the sink of the new signal and returns a disposable
  /// that the signal disposes after its terminal event.
  template <class F>
  static signal make(F generator) {
    static_assert(std::is_invocable_r_v<disposable, F&, observer_type>,
                  "generator must return a disposable");
    auto [result, sink] = pipe();
    result.pimpl_->set_generator(generator(std::move(sink)));
    return result;
  }

  // -- observing --------------------------------------------------------------

  /// Adds `what` to the observers of this signal. Disposing the result
  /// removes `what` again.
  disposable observe(observer_type what) const {
    return pimpl_->observe(std::move(what));
  }

  /// Applies a step to each event of this signal.
  template <class Step>
  signal<typename Step::output_type, typename Step::output_error_type>
  transform(Step step) const;

  // -- step operators ---------------------------------------------------------

  template <class F>
  auto map(F f) const {
    return transform(map_step<T, E, F>{{}, std::move(f)});
  }

  template <class F>
  auto map_error(F f) const {
    return transform(map_error_step<T, E, F>{{}, std::move(f)});
  }

  template <class Predicate>
  signal filter(Predicate predicate) const {
    return transform(filter_step<T, E, Predicate>{{}, std::move(predicate)});
  }

  /// Forwards the first `n` values, then completes.
  signal take(size_t n) const;

  signal skip(size_t n) const {
    if (n == 0)
      return *this;
    return transform(skip_step<T, E>{{}, n});
  }

  template <class Predicate>
  signal take_while(Predicate predicate) const {
    using step_type = take_while_step<T, E, Predicate>;
    return transform(step_type{{}, std::move(predicate)});
  }

  template <class Predicate>
  signal skip_while(Predicate predicate) const {
    using step_type = skip_while_step<T, E, Predicate>;
    return transform(step_type{{}, std::move(predicate)});
  }

  /// Emits the last `n` values after this signal completed.
  signal take_last(size_t n) const {
    return transform(take_last_step<T, E>{{}, n, {}});
  }

  template <class U, class F>
  signal<U, E> scan(U initial, F f) const {
    using step_type = scan_step<T, E, U, F>;
    return transform(step_type{{}, std::move(initial), std::move(f)});
  }

  template <class U, class F>
  signal<U, E> reduce(U initial, F f) const {
    using step_type = reduce_step<T, E, U, F>;
    return transform(step_type{{}, std::move(initial), std::move(f)});
  }

  signal<std::vector<T>, E> collect() const {
    return transform(collect_step<T, E>{{}, {}});
  }

  signal skip_repeats() const {
    return transform(skip_repeats_step<T, E>{{}, {}, {}});
  }

  template <class Predicate>
  signal skip_repeats(Predicate predicate) const {
    using step_type = skip_repeats_step<T, E, Predicate>;
    return transform(step_type{{}, std::move(predicate), {}});
  }

  signal<std::pair<T, T>, E> combine_previous() const {
    return transform(combine_previous_step<T, E>{{}, std::nullopt});
  }

  signal<std::pair<T, T>, E> combine_previous(T initial) const {
    return transform(combine_previous_step<T, E>{{}, std::move(initial)});
  }

  signal<event<T, E>, no_error> materialize() const {
    return transform(materialize_step<T, E>{});
  }

  /// Unwraps the events of a materialized signal.
  template <class Event = T>
  auto dematerialize() const {
    static_assert(std::is_same_v<E, no_error>,
                  "dematerialize requires a signal that never fails");
    using step_type = dematerialize_step<typename Event::value_type,
                                         typename Event::error_type>;
    return transform(step_type{});
  }

  /// Drops empty optionals and unwraps all others.
  template <class Optional = T>
  auto ignore_nil() const {
    using step_type = ignore_nil_step<typename Optional::value_type, E>;
    return transform(step_type{});
  }

  /// Converts a signal that never fails into a signal with error type `E2`.
  template <class E2>
  signal<T, E2> promote_errors() const {
    static_assert(std::is_same_v<E, no_error>,
                  "promote_errors requires a signal that never fails");
    return transform(promote_errors_step<T, E2>{});
  }

  /// Forwards each value for which `f` returns a success and fails with
  /// the first failure.
  template <class F>
  signal attempt(F f) const {
    return transform(attempt_step<T, E, F>{{}, std::move(f)});
  }

  /// Maps each value with `f` and fails with the first failure.
  template <class F>
  auto attempt_map(F f) const {
    return transform(attempt_map_step<T, E, F>{{}, std::move(f)});
  }

  // -- combining operators ----------------------------------------------------

  /// Emits the latest values of both signals whenever either signal emits a
  /// value, once both signals emitted at least one value. Completes after
  /// both signals completed.
  template <class U>
  signal<std::pair<T, U>, E> combine_latest_with(signal<U, E> other) const;

  /// Pairs the n-th value of this signal with the n-th value of `other`.
  /// Completes as soon as one input completed and has no buffered values.
  template <class U>
  signal<std::pair<T, U>, E> zip_with(signal<U, E> other) const;

  /// Emits the latest value of this signal whenever `sampler` emits.
  /// Completes after both signals completed.
  signal sample_on(signal<unit_t, no_error> sampler) const;

  /// Forwards events until `trigger` emits a value or completes.
  signal take_until(signal<unit_t, no_error> trigger) const;

  /// Forwards events of this signal until `replacement` emits its first
  /// event, then forwards only the events of `replacement`.
  signal take_until_replacement(signal replacement) const;

  // -- scheduling operators ---------------------------------------------------

  /// Forwards all events on `sched`.
  signal observe_on(scheduler_ptr sched) const;

  /// Delays values and completion by `interval`. Errors and interruptions
  /// are forwarded on `sched` without delay.
  signal delay(timespan interval, date_scheduler_ptr sched) const;

  /// Forwards at most one value per `interval`, always the latest one.
  signal throttle(timespan interval, date_scheduler_ptr sched) const;

  /// Fails with `reason` unless this signal terminates within `interval`.
  signal timeout_with_error(E reason, timespan interval,
                            date_scheduler_ptr sched) const;

  // -- properties -------------------------------------------------------------

  bool valid() const noexcept {
    return pimpl_ != nullptr;
  }

  explicit operator bool() const noexcept {
    return valid();
  }

  /// Returns whether this signal did not deliver its terminal event yet.
  bool alive() const {
    return pimpl_->alive();
  }

  /// Returns the number of registered observers.
  size_t num_observers() const {
    return pimpl_->num_observers();
  }

  impl* ptr() const noexcept {
    return pimpl_.get();
  }

private:
  intrusive_ptr<impl> pimpl_;
};

// -- state for combining operators --------------------------------------------

namespace detail {

template <class T, class U, class E>
struct combine_latest_state : ref_counted {
  using output_type = std::pair<T, U>;

  explicit combine_latest_state(observer<output_type, E> sink)
    : out(std::move(sink)) {
    // nop
  }

  template <class F>
  void on_next(F&& store) {
    std::optional<output_type> value;
    {
      std::unique_lock guard{mtx};
      store();
      if (left && right)
        value.emplace(*left, *right);
    }
    if (value)
      out.on_next(std::move(*value));
  }

  void on_completed(bool& flag) {
    bool done = false;
    {
      std::unique_lock guard{mtx};
      flag = true;
      done = left_completed && right_completed;
    }
    if (done)
      out.on_completed();
  }

  std::mutex mtx;
  std::optional<T> left;
  std::optional<U> right;
  bool left_completed = false;
  bool right_completed = false;
  observer<output_type, E> out;
};

template <class T, class U, class E>
struct zip_state : ref_counted {
  using output_type = std::pair<T, U>;

  explicit zip_state(observer<output_type, E> sink) : out(std::move(sink)) {
    // nop
  }

  /// Runs `f` under the lock, then sends all complete pairs.
  template <class F>
  void update(F&& f) {
    std::vector<output_type> values;
    bool done = false;
    {
      std::unique_lock guard{mtx};
      f();
      while (!left.empty() && !right.empty()) {
        values.emplace_back(std::move(left.front()), std::move(right.front()));
        left.pop_front();
        right.pop_front();
      }
      done = (left_completed && left.empty())
             || (right_completed && right.empty());
    }
    for (auto& value : values)
      out.on_next(std::move(value));
    if (done)
      out.on_completed();
  }

  std::mutex mtx;
  std::deque<T> left;
  std::deque<U> right;
  bool left_completed = false;
  bool right_completed = false;
  observer<output_type, E> out;
};

template <class T, class E>
struct sample_state : ref_counted {
  explicit sample_state(observer<T, E> sink) : out(std::move(sink)) {
    // nop
  }

  void on_completed(bool& flag) {
    bool done = false;
    {
      std::unique_lock guard{mtx};
      flag = true;
      done = self_completed && sampler_completed;
    }
    if (done)
      out.on_completed();
  }

  std::mutex mtx;
  std::optional<T> latest;
  bool self_completed = false;
  bool sampler_completed = false;
  observer<T, E> out;
};

template <class T>
struct throttle_state {
  std::optional<timestamp> previous;
  std::optional<T> pending;
};

} // namespace detail

// -- member function definitions ----------------------------------------------

template <class T, class E>
template <class Step>
signal<typename Step::output_type, typename Step::output_error_type>
signal<T, E>::transform(Step step) const {
  using output_signal
    = signal<typename Step::output_type, typename Step::output_error_type>;
  using sink_type = typename output_signal::observer_type;
  return output_signal::make([src{*this}, step{std::move(step)}](
                               sink_type out) mutable {
    auto obs = make_counted<detail::step_observer<Step>>(std::move(step),
                                                          std::move(out));
    auto sub = src.observe(observer_type{obs});
    obs->set_upstream(sub);
    return sub;
  });
}

template <class T, class E>
signal<T, E> signal<T, E>::take(size_t n) const {
  if (n == 0)
    return make([](observer_type out) {
      out.on_completed();
      return disposable{};
    });
  return transform(take_step<T, E>{{}, n});
}

template <class T, class E>
template <class U>
signal<std::pair<T, U>, E>
signal<T, E>::combine_latest_with(signal<U, E> other) const {
  using output_signal = signal<std::pair<T, U>, E>;
  using state_type = detail::combine_latest_state<T, U, E>;
  return output_signal::make([self{*this}, other](
                               typename output_signal::observer_type out) {
    auto st = make_counted<state_type>(out);
    auto left = self.observe(make_event_observer<T, E>([st](const event<T, E>& ev) {
      switch (ev.kind()) {
        case event_kind::next:
          st->on_next([&] { st->left = *ev.value(); });
          break;
        case event_kind::error:
          st->out.on_error(*ev.reason());
          break;
        case event_kind::completed:
          st->on_completed(st->left_completed);
          break;
        case event_kind::interrupted:
          st->out.on_interrupted();
          break;
      }
    }));
    auto right = other.observe(make_event_observer<U, E>([st](const event<U, E>& ev) {
      switch (ev.kind()) {
        case event_kind::next:
          st->on_next([&] { st->right = *ev.value(); });
          break;
        case event_kind::error:
          st->out.on_error(*ev.reason());
          break;
        case event_kind::completed:
          st->on_completed(st->right_completed);
          break;
        case event_kind::interrupted:
          st->out.on_interrupted();
          break;
      }
    }));
    return disposable::make_composite({std::move(left), std::move(right)});
  });
}

template <class T, class E>
template <class U>
signal<std::pair<T, U>, E> signal<T, E>::zip_with(signal<U, E> other) const {
  using output_signal = signal<std::pair<T, U>, E>;
  using state_type = detail::zip_state<T, U, E>;
  return output_signal::make([self{*this}, other](
                               typename output_signal::observer_type out) {
    auto st = make_counted<state_type>(out);
    auto left = self.observe(make_event_observer<T, E>([st](const event<T, E>& ev) {
      switch (ev.kind()) {
        case event_kind::next:
          st->update([&] { st->left.push_back(*ev.value()); });
          break;
        case event_kind::error:
          st->out.on_error(*ev.reason());
          break;
        case event_kind::completed:
          st->update([&] { st->left_completed = true; });
          break;
        case event_kind::interrupted:
          st->out.on_interrupted();
          break;
      }
    }));
    auto right = other.observe(make_event_observer<U, E>([st](const event<U, E>& ev) {
      switch (ev.kind()) {
        case event_kind::next:
          st->update([&] { st->right.push_back(*ev.value()); });
          break;
        case event_kind::error:
          st->out.on_error(*ev.reason());
          break;
        case event_kind::completed:
          st->update([&] { st->right_completed = true; });
          break;
        case event_kind::interrupted:
          st->out.on_interrupted();
          break;
      }
    }));
    return disposable::make_composite({std::move(left), std::move(right)});
  });
}

template <class T, class E>
signal<T, E> signal<T, E>::sample_on(signal<unit_t, no_error> sampler) const {
  using state_type = detail::sample_state<T, E>;
  return make([self{*this}, sampler](observer_type out) {
    auto st = make_counted<state_type>(out);
    auto values = self.observe(make_event_observer<T, E>([st](const event_type& ev) {
      switch (ev.kind()) {
        case event_kind::next: {
          std::unique_lock guard{st->mtx};
          st->latest = *ev.value();
          break;
        }
        case event_kind::error:
          st->out.on_error(*ev.reason());
          break;
        case event_kind::completed:
          st->on_completed(st->self_completed);
          break;
        case event_kind::interrupted:
          st->out.on_interrupted();
          break;
      }
    }));
    using sampler_event = event<unit_t, no_error>;
    auto ticks = sampler.observe(make_event_observer<unit_t, no_error>(
      [st](const sampler_event& ev) {
        switch (ev.kind()) {
          case event_kind::next: {
            std::optional<T> value;
            {
              std::unique_lock guard{st->mtx};
              value = st->latest;
            }
            if (value)
              st->out.on_next(std::move(*value));
            break;
          }
          case event_kind::completed:
            st->on_completed(st->sampler_completed);
            break;
          case event_kind::interrupted:
            st->out.on_interrupted();
            break;
          case event_kind::error: // no_error
            break;
        }
      }));
    return disposable::make_composite({std::move(values), std::move(ticks)});
  });
}

template <class T, class E>
signal<T, E> signal<T, E>::take_until(signal<unit_t, no_error> trigger) const {
  return make([self{*this}, trigger](observer_type out) {
    using trigger_event = event<unit_t, no_error>;
    auto stop = trigger.observe(make_event_observer<unit_t, no_error>(
      [out](const trigger_event& ev) {
        if (ev.is_next() || ev.is_completed())
          out.on_completed();
      }));
    auto values = self.observe(out);
    return disposable::make_composite({std::move(stop), std::move(values)});
  });
}

template <class T, class E>
signal<T, E> signal<T, E>::take_until_replacement(signal replacement) const {
  return make([self{*this}, replacement](observer_type out) {
    auto replaced = std::make_shared<std::atomic<bool>>(false);
    auto values = self.observe(
      make_event_observer<T, E>([out, replaced](const event_type& ev) {
        if (*replaced || ev.is_completed())
          return;
        out.on_event(ev);
      }));
    auto rest = replacement.observe(
      make_event_observer<T, E>([out, replaced, values](const event_type& ev) {
        if (!replaced->exchange(true))
          values.dispose();
        out.on_event(ev);
      }));
    return disposable::make_composite({values, std::move(rest)});
  });
}

template <class T, class E>
signal<T, E> signal<T, E>::observe_on(scheduler_ptr sched) const {
  return make([self{*this}, sched](observer_type out) {
    return self.observe(
      make_event_observer<T, E>([out, sched](const event_type& ev) {
        sched->schedule_fn([out, ev] { out.on_event(ev); });
      }));
  });
}

template <class T, class E>
signal<T, E> signal<T, E>::delay(timespan interval,
                                 date_scheduler_ptr sched) const {
  if (interval.count() < 0)
    RELAY_RAISE_ERROR(std::invalid_argument, "delay: negative interval");
  return make([self{*this}, interval, sched](observer_type out) {
    return self.observe(
      make_event_observer<T, E>([out, interval, sched](const event_type& ev) {
        if (ev.is_next() || ev.is_completed())
          sched->schedule_fn_after(sched->now() + interval,
                                   [out, ev] { out.on_event(ev); });
        else
          sched->schedule_fn([out, ev] { out.on_event(ev); });
      }));
  });
}

template <class T, class E>
signal<T, E> signal<T, E>::throttle(timespan interval,
                                    date_scheduler_ptr sched) const {
  if (interval.count() < 0)
    RELAY_RAISE_ERROR(std::invalid_argument, "throttle: negative interval");
  using state_type = detail::atomic_cell<detail::throttle_state<T>>;
  return make([self{*this}, interval, sched](observer_type out) {
    auto st = std::make_shared<state_type>();
    auto pending = serial_disposable::make();
    auto sub = self.observe(make_event_observer<T, E>(
      [out, interval, sched, st, pending](const event_type& ev) {
        if (!ev.is_next()) {
          pending.set(sched->schedule_fn([out, ev] { out.on_event(ev); }));
          return;
        }
        auto now = sched->now();
        auto when = now;
        st->modify([&](detail::throttle_state<T>& x) {
          x.pending = *ev.value();
          if (x.previous)
            when = std::max(*x.previous + interval, now);
        });
        pending.set(sched->schedule_fn_after(when, [out, st, when] {
          auto old = st->modify([&](detail::throttle_state<T>& x) {
            if (x.pending) {
              x.pending = std::nullopt;
              x.previous = when;
            }
          });
          if (old.pending)
            out.on_next(std::move(*old.pending));
        }));
      }));
    return disposable::make_composite({pending.as_disposable(), sub});
  });
}

template <class T, class E>
signal<T, E> signal<T, E>::timeout_with_error(E reason, timespan interval,
                                              date_scheduler_ptr sched) const {
  if (interval.count() < 0)
    RELAY_RAISE_ERROR(std::invalid_argument,
                      "timeout_with_error: negative interval");
  return make([self{*this}, reason, interval, sched](observer_type out) {
    auto timeout = sched->schedule_fn_after(sched->now() + interval,
                                            [out, reason] {
                                              out.on_error(reason);
                                            });
    auto sub = self.observe(out);
    return disposable::make_composite({std::move(timeout), std::move(sub)});
  });
}

} // namespace relay
