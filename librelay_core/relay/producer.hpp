// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

#include "relay/defaults.hpp"
#include "relay/detail/beacon.hpp"
#include "relay/detail/replay_buffer.hpp"
#include "relay/disposable.hpp"
#include "relay/event.hpp"
#include "relay/flatten_strategy.hpp"
#include "relay/fwd.hpp"
#include "relay/intrusive_ptr.hpp"
#include "relay/logger.hpp"
#include "relay/make_counted.hpp"
#include "relay/no_error.hpp"
#include "relay/observer.hpp"
#include "relay/raise_error.hpp"
#include "relay/ref_counted.hpp"
#include "relay/result.hpp"
#include "relay/scheduler.hpp"
#include "relay/signal.hpp"
#include "relay/timestamp.hpp"
#include "relay/unit.hpp"

namespace relay {

/// Callbacks for `producer::on`. Empty members are skipped.
template <class T, class E>
struct producer_hooks {
  /// Runs before the producer starts its work.
  std::function<void()> on_started;

  /// Runs for every event before the more specific callback.
  std::function<void(const event<T, E>&)> on_event;

  std::function<void(const T&)> on_next;

  std::function<void(const E&)> on_error;

  std::function<void()> on_completed;

  std::function<void()> on_interrupted;

  /// Runs after the terminal event, regardless of its kind.
  std::function<void()> on_terminated;

  /// Runs when the root disposable of a started producer gets disposed.
  std::function<void()> on_disposed;
};

} // namespace relay

namespace relay::detail {

template <class T, class E, class F>
class producer_from_fn;

template <class T, class E>
class times_state;

template <class T>
struct is_producer : std::false_type {};

template <class T, class E>
struct is_producer<producer<T, E>> : std::true_type {};

template <class T>
constexpr bool is_producer_v = is_producer<T>::value;

template <class T, class E>
producer<T, E> flatten_merge(const producer<producer<T, E>, E>& outer);

template <class T, class E>
producer<T, E> flatten_concat(const producer<producer<T, E>, E>& outer);

template <class T, class E>
producer<T, E> flatten_latest(const producer<producer<T, E>, E>& outer);

} // namespace relay::detail

namespace relay {

/// A deferred computation that creates a fresh signal each time it starts.
/// Copies of a producer share the same work description. Each start runs the
/// work anew with its own root disposable.
template <class T, class E>
class producer {
public:
  // -- member types -----------------------------------------------------------

  using value_type = T;

  using error_type = E;

  using event_type = event<T, E>;

  using observer_type = observer<T, E>;

  using signal_type = signal<T, E>;

  /// Internal implementation class of a `producer`.
  class impl : public virtual ref_counted {
  public:
    /// Runs the work for a single start. The work sends events to `out` and
    /// registers its resources at `root`. Work must stop once `root` reports
    /// `disposed()`.
    virtual void on_start(observer_type out, composite_disposable root) const
      = 0;
  };

  // -- constructors, destructors, and assignment operators --------------------

  explicit producer(intrusive_ptr<impl> pimpl) noexcept
    : pimpl_(std::move(pimpl)) {
    // nop
  }

  producer() noexcept = default;

  producer(producer&&) noexcept = default;

  producer(const producer&) noexcept = default;

  producer& operator=(producer&&) noexcept = default;

  producer& operator=(const producer&) noexcept = default;

  // -- factories --------------------------------------------------------------

  /// Creates a producer that calls `fn(out, root)` on each start.
  template <class F>
  static producer make(F fn) {
    static_assert(std::is_invocable_v<const F&, observer_type,
                                      composite_disposable>,
                  "fn must accept an observer and a composite disposable");
    using impl_type = detail::producer_from_fn<T, E, F>;
    return producer{make_counted<impl_type>(std::move(fn))};
  }

  /// Emits `value` and completes.
  static producer just(T value) {
    return make([value{std::move(value)}](observer_type out,
                                          const composite_disposable&) {
      out.on_next(value);
      out.on_completed();
    });
  }

  /// Fails immediately with `reason`.
  static producer fail(E reason) {
    return make([reason{std::move(reason)}](observer_type out,
                                            const composite_disposable&) {
      out.on_error(reason);
    });
  }

  /// Emits the value and completes or fails, depending on `x`.
  static producer from_result(result<T, E> x) {
    return make([x{std::move(x)}](observer_type out,
                                  const composite_disposable&) {
      if (x.has_value()) {
        out.on_next(x.value());
        out.on_completed();
      } else {
        out.on_error(x.error());
      }
    });
  }

  /// Emits each element of `xs` in order and completes. Stops early if the
  /// consumer disposes the producer.
  template <class Container>
  static producer from_container(Container xs) {
    return make([xs{std::move(xs)}](observer_type out,
                                    composite_disposable root) {
      for (const auto& x : xs) {
        if (root.disposed())
          return;
        out.on_next(x);
      }
      out.on_completed();
    });
  }

  /// Completes immediately.
  static producer empty() {
    return make([](observer_type out, const composite_disposable&) {
      out.on_completed();
    });
  }

  /// Never sends any event.
  static producer never() {
    return make([](const observer_type&, const composite_disposable&) {
      // nop
    });
  }

  /// Runs `fn` on each start and emits its result.
  /// @pre `fn()` returns a `result<T, E>`
  template <class F>
  static producer from_attempt(F fn) {
    return make([fn{std::move(fn)}](observer_type out,
                                    const composite_disposable&) {
      auto res = fn();
      if (res.has_value()) {
        out.on_next(res.value());
        out.on_completed();
      } else {
        out.on_error(res.error());
      }
    });
  }

  /// Creates a producer that replays up to `capacity` values plus the
  /// terminal event to each consumer. Returns the producer together with the
  /// observer for feeding events into the buffer.
  static std::pair<producer, observer_type>
  buffer(size_t capacity = defaults::buffer::capacity);

  // -- starting ---------------------------------------------------------------

  /// Creates the signal for a new start and passes it to `setup` together
  /// with a disposable for interrupting the work, then runs the work unless
  /// `setup` disposed it already.
  template <class Setup>
  void start_with_signal(Setup&& setup) const;

  /// Starts the work and forwards all events to `out`.
  disposable start(observer_type out) const {
    disposable result;
    start_with_signal([&](const signal_type& sig, disposable cancel) {
      sig.observe(std::move(out));
      result = std::move(cancel);
    });
    return result;
  }

  /// Starts the work without observing any event.
  disposable start() const {
    disposable result;
    start_with_signal([&](const signal_type&, disposable cancel) {
      result = std::move(cancel);
    });
    return result;
  }

  /// Starts the work and calls the given callbacks for the events.
  template <class OnNext, class OnError = unit_t, class OnCompleted = unit_t,
            class OnInterrupted = unit_t>
  disposable for_each(OnNext on_next, OnError on_error = {},
                      OnCompleted on_completed = {},
                      OnInterrupted on_interrupted = {}) const {
    return start(make_observer<T, E>(std::move(on_next), std::move(on_error),
                                     std::move(on_completed),
                                     std::move(on_interrupted)));
  }

  // -- lifting ----------------------------------------------------------------

  /// Applies a signal transformation to each start of this producer.
  template <class F>
  auto lift(F f) const;

  /// Applies a binary signal transformation to each start of this producer
  /// and `other`. Starts `other` before this producer.
  template <class U, class E2, class F>
  auto lift(producer<U, E2> other, F f) const;

  // -- side effects -----------------------------------------------------------

  /// Runs the callbacks in `hooks` for the lifecycle of each start.
  producer on(producer_hooks<T, E> hooks) const;

  template <class F>
  producer do_on_started(F f) const {
    producer_hooks<T, E> hooks;
    hooks.on_started = std::move(f);
    return on(std::move(hooks));
  }

  template <class F>
  producer do_on_event(F f) const {
    producer_hooks<T, E> hooks;
    hooks.on_event = std::move(f);
    return on(std::move(hooks));
  }

  template <class F>
  producer do_on_next(F f) const {
    producer_hooks<T, E> hooks;
    hooks.on_next = std::move(f);
    return on(std::move(hooks));
  }

  template <class F>
  producer do_on_error(F f) const {
    producer_hooks<T, E> hooks;
    hooks.on_error = std::move(f);
    return on(std::move(hooks));
  }

  template <class F>
  producer do_on_completed(F f) const {
    producer_hooks<T, E> hooks;
    hooks.on_completed = std::move(f);
    return on(std::move(hooks));
  }

  template <class F>
  producer do_on_interrupted(F f) const {
    producer_hooks<T, E> hooks;
    hooks.on_interrupted = std::move(f);
    return on(std::move(hooks));
  }

  template <class F>
  producer do_on_terminated(F f) const {
    producer_hooks<T, E> hooks;
    hooks.on_terminated = std::move(f);
    return on(std::move(hooks));
  }

  template <class F>
  producer do_on_disposed(F f) const {
    producer_hooks<T, E> hooks;
    hooks.on_disposed = std::move(f);
    return on(std::move(hooks));
  }

  /// Starts the work on `sched` instead of the calling thread.
  producer start_on(scheduler_ptr sched) const;

  // -- transformation operators -----------------------------------------------

  template <class F>
  auto map(F f) const {
    return lift([f{std::move(f)}](const signal_type& sig) {
      return sig.map(f); //
    });
  }

  template <class F>
  auto map_error(F f) const {
    return lift([f{std::move(f)}](const signal_type& sig) {
      return sig.map_error(f); //
    });
  }

  template <class Predicate>
  producer filter(Predicate predicate) const {
    return lift([predicate{std::move(predicate)}](const signal_type& sig) {
      return sig.filter(predicate);
    });
  }

  /// Forwards the first `n` values, then completes. Completes immediately
  /// without starting this producer if `n == 0`.
  producer take(size_t n) const {
    if (n == 0)
      return empty();
    return lift([n](const signal_type& sig) { return sig.take(n); });
  }

  producer skip(size_t n) const {
    return lift([n](const signal_type& sig) { return sig.skip(n); });
  }

  template <class Predicate>
  producer take_while(Predicate predicate) const {
    return lift([predicate{std::move(predicate)}](const signal_type& sig) {
      return sig.take_while(predicate);
    });
  }

  template <class Predicate>
  producer skip_while(Predicate predicate) const {
    return lift([predicate{std::move(predicate)}](const signal_type& sig) {
      return sig.skip_while(predicate);
    });
  }

  producer take_last(size_t n) const {
    return lift([n](const signal_type& sig) { return sig.take_last(n); });
  }

  template <class U, class F>
  producer<U, E> scan(U initial, F f) const {
    return lift([initial{std::move(initial)},
                 f{std::move(f)}](const signal_type& sig) {
      return sig.scan(initial, f);
    });
  }

  template <class U, class F>
  producer<U, E> reduce(U initial, F f) const {
    return lift([initial{std::move(initial)},
                 f{std::move(f)}](const signal_type& sig) {
      return sig.reduce(initial, f);
    });
  }

  producer<std::vector<T>, E> collect() const {
    return lift([](const signal_type& sig) { return sig.collect(); });
  }

  producer skip_repeats() const {
    return lift([](const signal_type& sig) { return sig.skip_repeats(); });
  }

  template <class Predicate>
  producer skip_repeats(Predicate predicate) const {
    return lift([predicate{std::move(predicate)}](const signal_type& sig) {
      return sig.skip_repeats(predicate);
    });
  }

  producer<std::pair<T, T>, E> combine_previous() const {
    return lift([](const signal_type& sig) { return sig.combine_previous(); });
  }

  producer<std::pair<T, T>, E> combine_previous(T initial) const {
    return lift([initial{std::move(initial)}](const signal_type& sig) {
      return sig.combine_previous(initial);
    });
  }

  producer<event<T, E>, no_error> materialize() const {
    return lift([](const signal_type& sig) { return sig.materialize(); });
  }

  template <class Event = T>
  auto dematerialize() const {
    return lift([](const signal_type& sig) {
      return sig.template dematerialize<Event>();
    });
  }

  template <class Optional = T>
  auto ignore_nil() const {
    return lift([](const signal_type& sig) {
      return sig.template ignore_nil<Optional>();
    });
  }

  template <class E2>
  producer<T, E2> promote_errors() const {
    return lift([](const signal_type& sig) {
      return sig.template promote_errors<E2>();
    });
  }

  template <class F>
  producer attempt(F f) const {
    return lift([f{std::move(f)}](const signal_type& sig) {
      return sig.attempt(f); //
    });
  }

  template <class F>
  auto attempt_map(F f) const {
    return lift([f{std::move(f)}](const signal_type& sig) {
      return sig.attempt_map(f);
    });
  }

  // -- combining operators ----------------------------------------------------

  template <class U>
  producer<std::pair<T, U>, E> combine_latest_with(producer<U, E> other) const {
    return lift(std::move(other),
                [](const signal_type& lhs, const signal<U, E>& rhs) {
                  return lhs.combine_latest_with(rhs);
                });
  }

  template <class U>
  producer<std::pair<T, U>, E> zip_with(producer<U, E> other) const {
    return lift(std::move(other),
                [](const signal_type& lhs, const signal<U, E>& rhs) {
                  return lhs.zip_with(rhs);
                });
  }

  producer sample_on(producer<unit_t, no_error> sampler) const {
    return lift(std::move(sampler),
                [](const signal_type& lhs,
                   const signal<unit_t, no_error>& rhs) {
                  return lhs.sample_on(rhs);
                });
  }

  producer take_until(producer<unit_t, no_error> trigger) const {
    return lift(std::move(trigger),
                [](const signal_type& lhs,
                   const signal<unit_t, no_error>& rhs) {
                  return lhs.take_until(rhs);
                });
  }

  producer take_until_replacement(producer replacement) const {
    return lift(std::move(replacement),
                [](const signal_type& lhs, const signal_type& rhs) {
                  return lhs.take_until_replacement(rhs);
                });
  }

  // -- scheduling operators ---------------------------------------------------

  producer observe_on(scheduler_ptr sched) const {
    return lift([sched{std::move(sched)}](const signal_type& sig) {
      return sig.observe_on(sched);
    });
  }

  producer delay(timespan interval, date_scheduler_ptr sched) const {
    if (interval.count() < 0)
      RELAY_RAISE_ERROR(std::invalid_argument, "negative delay interval");
    return lift([interval, sched{std::move(sched)}](const signal_type& sig) {
      return sig.delay(interval, sched);
    });
  }

  producer throttle(timespan interval, date_scheduler_ptr sched) const {
    if (interval.count() < 0)
      RELAY_RAISE_ERROR(std::invalid_argument, "negative throttle interval");
    return lift([interval, sched{std::move(sched)}](const signal_type& sig) {
      return sig.throttle(interval, sched);
    });
  }

  producer timeout_with_error(E reason, timespan interval,
                              date_scheduler_ptr sched) const {
    if (interval.count() < 0)
      RELAY_RAISE_ERROR(std::invalid_argument, "negative timeout interval");
    return lift([reason{std::move(reason)}, interval,
                 sched{std::move(sched)}](const signal_type& sig) {
      return sig.timeout_with_error(reason, interval, sched);
    });
  }

  // -- flattening -------------------------------------------------------------

  /// Flattens a producer of producers according to `strategy`.
  /// @pre `T` is a `producer<U, E>`
  template <class Inner = T>
  auto flatten(flatten_strategy strategy) const {
    static_assert(detail::is_producer_v<Inner>,
                  "flatten requires a producer of producers");
    static_assert(std::is_same_v<typename Inner::error_type, E>,
                  "inner producers must have the same error type");
    switch (strategy) {
      case flatten_strategy::merge:
        return detail::flatten_merge(*this);
      case flatten_strategy::concatenate:
        return detail::flatten_concat(*this);
      case flatten_strategy::latest:
        break;
    }
    return detail::flatten_latest(*this);
  }

  /// Maps each value to a producer and flattens the result according to
  /// `strategy`.
  template <class F>
  auto flat_map(flatten_strategy strategy, F f) const {
    return map(std::move(f)).flatten(strategy);
  }

  /// Replaces a failed start with the producer returned by `handler`.
  template <class F>
  auto flat_map_error(F handler) const;

  // -- sequencing -------------------------------------------------------------

  /// Forwards all events of this producer and then of `next`.
  producer concat(producer next) const {
    using outer_type = producer<producer, E>;
    auto inputs = std::vector<producer>{*this, std::move(next)};
    return outer_type::from_container(std::move(inputs))
      .flatten(flatten_strategy::concatenate);
  }

  /// Waits for this producer to complete, discarding its values, and then
  /// forwards the events of `replacement`. Errors and interruptions of this
  /// producer skip `replacement`.
  template <class U>
  producer<U, E> then(producer<U, E> replacement) const;

  /// Repeats this producer `n` times, starting the next run after the
  /// previous one completed. Returns `empty()` for `n == 0`.
  producer times(size_t n) const;

  /// Restarts this producer on error, at most `n` times.
  producer retry(size_t n) const {
    if (n == 0)
      return *this;
    return flat_map_error([self{*this}, n](const E&) {
      return self.retry(n - 1); //
    });
  }

  // -- blocking reducers ------------------------------------------------------

  /// Starts the producer and blocks until it terminates. Returns the only
  /// value, the error, or `std::nullopt` if the producer emitted no value or
  /// more than one value.
  std::optional<result<T, E>> single() const;

  /// Blocks until the first value or the terminal event.
  std::optional<result<T, E>> first() const {
    return take(1).single();
  }

  /// Blocks until the producer terminates and returns its last value.
  std::optional<result<T, E>> last() const {
    return take_last(1).single();
  }

  /// Blocks until the producer terminates, discarding all values.
  result<unit_t, E> wait() const {
    auto res = then(producer<unit_t, E>::just(unit)).last();
    if (!res)
      return result<unit_t, E>::success(unit);
    return std::move(*res);
  }

  // -- properties -------------------------------------------------------------

  bool valid() const noexcept {
    return pimpl_ != nullptr;
  }

  explicit operator bool() const noexcept {
    return valid();
  }

  impl* ptr() const noexcept {
    return pimpl_.get();
  }

private:
  intrusive_ptr<impl> pimpl_;
};

} // namespace relay

namespace relay::detail {

template <class T, class E, class F>
class producer_from_fn : public producer<T, E>::impl {
public:
  explicit producer_from_fn(F fn) : fn_(std::move(fn)) {
    // nop
  }

  void on_start(observer<T, E> out, composite_disposable root) const override {
    fn_(std::move(out), std::move(root));
  }

private:
  F fn_;
};

/// Restarts a producer after each completion until the requested number of
/// runs is reached.
template <class T, class E>
class times_state : public ref_counted {
public:
  times_state(producer<T, E> src, observer<T, E> out,
              serial_disposable current)
    : src_(std::move(src)), out_(std::move(out)), current_(std::move(current)) {
    // nop
  }

  void iterate(size_t remaining) {
    src_.start_with_signal([this, remaining](const signal<T, E>& sig,
                                             disposable cancel) {
      current_.set(std::move(cancel));
      auto strong_this = intrusive_ptr<times_state>{this};
      sig.observe(make_event_observer<T, E>(
        [strong_this, remaining](const event<T, E>& what) {
          strong_this->on_event(what, remaining);
        }));
    });
  }

private:
  void on_event(const event<T, E>& what, size_t remaining) {
    if (what.is_completed() && remaining > 1) {
      iterate(remaining - 1);
      return;
    }
    out_.on_event(what);
  }

  producer<T, E> src_;
  observer<T, E> out_;
  serial_disposable current_;
};

} // namespace relay::detail

namespace relay {

template <class T, class E>
std::pair<producer<T, E>, observer<T, E>>
producer<T, E>::buffer(size_t capacity) {
  using state_type = detail::replay_buffer<T, E>;
  auto state = make_counted<state_type>(capacity);
  auto sink = make_event_observer<T, E>(
    [state](const event_type& what) { state->push(what); });
  auto src = make([state](observer_type out, composite_disposable root) {
    if (auto token = state->attach(std::move(out)))
      root.add(make_disposable([state, key{*token}] { state->detach(key); }));
  });
  return {std::move(src), std::move(sink)};
}

template <class T, class E>
template <class Setup>
void producer<T, E>::start_with_signal(Setup&& setup) const {
  auto pipe = signal_type::pipe();
  auto sink = pipe.second;
  auto root = composite_disposable::make();
  auto cancel = make_disposable([sink, root] {
    sink.on_interrupted();
    root.dispose();
  });
  setup(pipe.first, cancel);
  if (cancel.disposed())
    return;
  auto wrapper = make_event_observer<T, E>(
    [sink, root](const event_type& what) {
      sink.on_event(what);
      if (what.is_terminating())
        root.dispose();
    });
  pimpl_->on_start(std::move(wrapper), root);
}

template <class T, class E>
template <class F>
auto producer<T, E>::lift(F f) const {
  using output_signal
    = std::decay_t<std::invoke_result_t<const F&, const signal_type&>>;
  using output_producer = producer<typename output_signal::value_type,
                                   typename output_signal::error_type>;
  using output_observer = typename output_producer::observer_type;
  return output_producer::make(
    [self{*this}, f{std::move(f)}](output_observer out,
                                   composite_disposable root) {
      self.start_with_signal([&](const signal_type& sig, disposable cancel) {
        root.add(std::move(cancel));
        f(sig).observe(out);
      });
    });
}

template <class T, class E>
template <class U, class E2, class F>
auto producer<T, E>::lift(producer<U, E2> other, F f) const {
  using other_signal = signal<U, E2>;
  using output_signal
    = std::decay_t<std::invoke_result_t<const F&, const signal_type&,
                                        const other_signal&>>;
  using output_producer = producer<typename output_signal::value_type,
                                   typename output_signal::error_type>;
  using output_observer = typename output_producer::observer_type;
  return output_producer::make(
    [self{*this}, other{std::move(other)},
     f{std::move(f)}](output_observer out, composite_disposable root) {
      self.start_with_signal([&](const signal_type& sig, disposable cancel) {
        root.add(std::move(cancel));
        other.start_with_signal(
          [&](const other_signal& other_sig, disposable other_cancel) {
            root.add(std::move(other_cancel));
            f(sig, other_sig).observe(out);
          });
      });
    });
}

template <class T, class E>
producer<T, E> producer<T, E>::on(producer_hooks<T, E> hooks) const {
  return make([self{*this}, hooks{std::move(hooks)}](
                observer_type out, composite_disposable root) {
    if (hooks.on_started)
      hooks.on_started();
    // Runs before disposing the upstream producer.
    if (hooks.on_disposed)
      root.add(make_disposable(hooks.on_disposed));
    self.start_with_signal([&](const signal_type& sig, disposable cancel) {
      root.add(std::move(cancel));
      sig.observe(make_event_observer<T, E>(
        [out, hooks](const event_type& what) {
          if (hooks.on_event)
            hooks.on_event(what);
          switch (what.kind()) {
            case event_kind::next:
              if (hooks.on_next)
                hooks.on_next(*what.value());
              break;
            case event_kind::error:
              if (hooks.on_error)
                hooks.on_error(*what.reason());
              break;
            case event_kind::completed:
              if (hooks.on_completed)
                hooks.on_completed();
              break;
            case event_kind::interrupted:
              if (hooks.on_interrupted)
                hooks.on_interrupted();
              break;
          }
          if (what.is_terminating() && hooks.on_terminated)
            hooks.on_terminated();
          out.on_event(what);
        }));
    });
  });
}

template <class T, class E>
producer<T, E> producer<T, E>::start_on(scheduler_ptr sched) const {
  return make([self{*this}, sched{std::move(sched)}](
                observer_type out, composite_disposable root) {
    root.add(sched->schedule_fn([self, out, root] {
      self.start_with_signal([&](const signal_type& sig, disposable cancel) {
        root.add(std::move(cancel));
        sig.observe(out);
      });
    }));
  });
}

template <class T, class E>
template <class F>
auto producer<T, E>::flat_map_error(F handler) const {
  using replacement_type
    = std::decay_t<std::invoke_result_t<const F&, const E&>>;
  static_assert(detail::is_producer_v<replacement_type>,
                "handler must return a producer");
  static_assert(std::is_same_v<typename replacement_type::value_type, T>,
                "handler must return a producer with the same value type");
  using error_t = typename replacement_type::error_type;
  using output_observer = observer<T, error_t>;
  return replacement_type::make(
    [self{*this}, handler{std::move(handler)}](output_observer out,
                                               composite_disposable root) {
      auto current = serial_disposable::make();
      root.add(current.as_disposable());
      self.start_with_signal([&](const signal_type& sig, disposable cancel) {
        current.set(std::move(cancel));
        sig.observe(make_event_observer<T, E>(
          [out, current, handler](const event_type& what) {
            switch (what.kind()) {
              case event_kind::next:
                out.on_next(*what.value());
                break;
              case event_kind::error: {
                RELAY_LOG_FLOW_DEBUG("replace failed producer");
                auto replacement = handler(*what.reason());
                replacement.start_with_signal(
                  [&](const signal<T, error_t>& next_sig,
                      disposable next_cancel) {
                    current.set(std::move(next_cancel));
                    next_sig.observe(out);
                  });
                break;
              }
              case event_kind::completed:
                out.on_completed();
                break;
              case event_kind::interrupted:
                out.on_interrupted();
                break;
            }
          }));
      });
    });
}

template <class T, class E>
template <class U>
producer<U, E> producer<T, E>::then(producer<U, E> replacement) const {
  using output_observer = observer<U, E>;
  auto drained = producer<U, E>::make([self{*this}](output_observer out,
                                                    composite_disposable root) {
    self.start_with_signal([&](const signal_type& sig, disposable cancel) {
      root.add(std::move(cancel));
      sig.observe(make_event_observer<T, E>([out](const event_type& what) {
        switch (what.kind()) {
          case event_kind::next:
            break;
          case event_kind::error:
            out.on_error(*what.reason());
            break;
          case event_kind::completed:
            out.on_completed();
            break;
          case event_kind::interrupted:
            out.on_interrupted();
            break;
        }
      }));
    });
  });
  return drained.concat(std::move(replacement));
}

template <class T, class E>
producer<T, E> producer<T, E>::times(size_t n) const {
  if (n == 0)
    return empty();
  if (n == 1)
    return *this;
  return make([self{*this}, n](observer_type out, composite_disposable root) {
    auto current = serial_disposable::make();
    root.add(current.as_disposable());
    auto state = make_counted<detail::times_state<T, E>>(self, std::move(out),
                                                         current);
    state->iterate(n);
  });
}

template <class T, class E>
std::optional<result<T, E>> producer<T, E>::single() const {
  using result_type = result<T, E>;
  auto gate = make_counted<detail::beacon>();
  std::optional<result_type> res;
  auto ambiguous = false;
  take(2).start(make_event_observer<T, E>([&, gate](const event_type& what) {
    switch (what.kind()) {
      case event_kind::next:
        if (res || ambiguous) {
          res.reset();
          ambiguous = true;
        } else {
          res.emplace(result_type::success(*what.value()));
        }
        break;
      case event_kind::error:
        res.emplace(result_type::failure(*what.reason()));
        gate->run();
        break;
      case event_kind::completed:
      case event_kind::interrupted:
        gate->run();
        break;
    }
  }));
  static_cast<void>(gate->wait());
  return res;
}

} // namespace relay

#include "relay/detail/flatten.hpp"
