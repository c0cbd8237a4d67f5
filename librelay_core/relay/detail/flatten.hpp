// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#pragma once

#include <atomic>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

#include "relay/detail/atomic_cell.hpp"
#include "relay/disposable.hpp"
#include "relay/event.hpp"
#include "relay/intrusive_ptr.hpp"
#include "relay/logger.hpp"
#include "relay/make_counted.hpp"
#include "relay/observer.hpp"
#include "relay/producer.hpp"
#include "relay/ref_counted.hpp"
#include "relay/signal.hpp"

namespace relay::detail {

// -- merge --------------------------------------------------------------------

/// Bookkeeping for a single start of a merged producer.
template <class T, class E>
class merge_state : public ref_counted {
public:
  using inner_type = producer<T, E>;

  merge_state(observer<T, E> out, composite_disposable root)
    : out_(std::move(out)), root_(std::move(root)) {
    // nop
  }

  void on_outer_event(const event<inner_type, E>& what) {
    switch (what.kind()) {
      case event_kind::next:
        start_inner(*what.value());
        break;
      case event_kind::error:
        out_.on_error(*what.reason());
        break;
      case event_kind::completed:
        decrement_in_flight();
        break;
      case event_kind::interrupted:
        out_.on_interrupted();
        break;
    }
  }

private:
  void start_inner(const inner_type& inner) {
    inner.start_with_signal([this](const signal<T, E>& sig,
                                   disposable cancel) {
      ++in_flight_;
      RELAY_LOG_FLOW_DEBUG("merge starts inner producer:"
                           << RELAY_ARG2("in-flight", in_flight_.load()));
      auto handle = root_.add(std::move(cancel));
      auto strong_this = intrusive_ptr<merge_state>{this};
      sig.observe(make_event_observer<T, E>(
        [strong_this, handle](const event<T, E>& what) {
          if (what.is_completed() || what.is_interrupted()) {
            handle.remove();
            strong_this->decrement_in_flight();
          } else {
            strong_this->out_.on_event(what);
          }
        }));
    });
  }

  void decrement_in_flight() {
    if (in_flight_.fetch_sub(1) == 1) {
      RELAY_LOG_FLOW_DEBUG("merge completes");
      out_.on_completed();
    }
  }

  observer<T, E> out_;
  composite_disposable root_;

  /// Counts the outer producer plus each started inner producer that did not
  /// terminate yet.
  std::atomic<size_t> in_flight_{1};
};

template <class T, class E>
producer<T, E> flatten_merge(const producer<producer<T, E>, E>& outer) {
  using outer_signal = signal<producer<T, E>, E>;
  using outer_event = event<producer<T, E>, E>;
  return producer<T, E>::make([outer](observer<T, E> out,
                                      composite_disposable root) {
    auto state = make_counted<merge_state<T, E>>(std::move(out), root);
    outer.start_with_signal([&](const outer_signal& sig, disposable cancel) {
      root.add(std::move(cancel));
      sig.observe(make_event_observer<producer<T, E>, E>(
        [state](const outer_event& what) { state->on_outer_event(what); }));
    });
  });
}

// -- concatenate --------------------------------------------------------------

/// Queue of inner producers for a single start of a concatenated producer.
/// The active producer stays at the front of the queue until it terminates.
template <class T, class E>
class concat_state : public ref_counted {
public:
  using inner_type = producer<T, E>;

  concat_state(observer<T, E> out, composite_disposable root)
    : out_(std::move(out)), root_(std::move(root)) {
    // nop
  }

  void on_outer_event(const event<inner_type, E>& what) {
    switch (what.kind()) {
      case event_kind::next:
        enqueue(*what.value());
        break;
      case event_kind::error:
        out_.on_error(*what.reason());
        break;
      case event_kind::completed: {
        // The last entry in the queue completes the aggregate once all
        // previously queued producers have terminated.
        auto strong_this = intrusive_ptr<concat_state>{this};
        enqueue(inner_type::make([strong_this](observer<T, E> inner_out,
                                               const composite_disposable&) {
          inner_out.on_completed();
          RELAY_LOG_FLOW_DEBUG("concat completes");
          strong_this->out_.on_completed();
        }));
        break;
      }
      case event_kind::interrupted:
        out_.on_interrupted();
        break;
    }
  }

  /// Drops all pending producers, including the completion entry that refers
  /// back to this state.
  void drop_pending() {
    std::deque<inner_type> dropped;
    {
      std::unique_lock guard{mtx_};
      dropped_ = true;
      dropped.swap(queue_);
    }
    RELAY_LOG_FLOW_DEBUG("concat drops pending producers:"
                         << RELAY_ARG2("count", dropped.size()));
  }

private:
  void enqueue(inner_type inner) {
    if (root_.disposed())
      return;
    auto start_now = false;
    {
      std::unique_lock guard{mtx_};
      if (dropped_)
        return;
      start_now = queue_.empty();
      queue_.push_back(inner);
    }
    if (start_now)
      start_next(std::move(inner));
  }

  std::optional<inner_type> dequeue() {
    if (root_.disposed())
      return std::nullopt;
    std::unique_lock guard{mtx_};
    if (!queue_.empty())
      queue_.pop_front();
    if (queue_.empty())
      return std::nullopt;
    return queue_.front();
  }

  void start_next(inner_type inner) {
    inner.start_with_signal([this](const signal<T, E>& sig,
                                   disposable cancel) {
      auto handle = root_.add(std::move(cancel));
      auto strong_this = intrusive_ptr<concat_state>{this};
      sig.observe(make_event_observer<T, E>(
        [strong_this, handle](const event<T, E>& what) {
          if (what.is_completed() || what.is_interrupted()) {
            handle.remove();
            if (auto next = strong_this->dequeue())
              strong_this->start_next(std::move(*next));
          } else {
            strong_this->out_.on_event(what);
          }
        }));
    });
  }

  observer<T, E> out_;
  composite_disposable root_;
  std::mutex mtx_;
  bool dropped_ = false;
  std::deque<inner_type> queue_;
};

template <class T, class E>
producer<T, E> flatten_concat(const producer<producer<T, E>, E>& outer) {
  using outer_signal = signal<producer<T, E>, E>;
  using outer_event = event<producer<T, E>, E>;
  return producer<T, E>::make([outer](observer<T, E> out,
                                      composite_disposable root) {
    auto state = make_counted<concat_state<T, E>>(std::move(out), root);
    root.add(make_disposable([state] { state->drop_pending(); }));
    outer.start_with_signal([&](const outer_signal& sig, disposable cancel) {
      root.add(std::move(cancel));
      sig.observe(make_event_observer<producer<T, E>, E>(
        [state](const outer_event& what) { state->on_outer_event(what); }));
    });
  });
}

// -- switch to latest ---------------------------------------------------------

struct latest_flags {
  bool outer_complete = false;
  bool inner_complete = true;
  /// Set while disposing the previous inner producer. Suppresses its
  /// interruption.
  bool replacing = false;
};

/// Tracks the latest inner producer for a single start of a switching
/// producer.
template <class T, class E>
class latest_state : public ref_counted {
public:
  using inner_type = producer<T, E>;

  latest_state(observer<T, E> out, serial_disposable current)
    : out_(std::move(out)), current_(std::move(current)) {
    // nop
  }

  void on_outer_event(const event<inner_type, E>& what) {
    switch (what.kind()) {
      case event_kind::next:
        start_inner(*what.value());
        break;
      case event_kind::error:
        out_.on_error(*what.reason());
        break;
      case event_kind::completed: {
        auto old = flags_.modify([](latest_flags& x) {
          x.outer_complete = true; //
        });
        if (old.inner_complete)
          complete();
        break;
      }
      case event_kind::interrupted:
        out_.on_interrupted();
        break;
    }
  }

private:
  void start_inner(const inner_type& inner) {
    inner.start_with_signal([this](const signal<T, E>& sig,
                                   disposable cancel) {
      RELAY_LOG_FLOW_DEBUG("switch to latest inner producer");
      flags_.modify([](latest_flags& x) { x.replacing = true; });
      current_.set(std::move(cancel));
      flags_.modify([](latest_flags& x) {
        x.replacing = false;
        x.inner_complete = false;
      });
      auto strong_this = intrusive_ptr<latest_state>{this};
      sig.observe(make_event_observer<T, E>(
        [strong_this](const event<T, E>& what) {
          strong_this->on_inner_event(what);
        }));
    });
  }

  void on_inner_event(const event<T, E>& what) {
    switch (what.kind()) {
      case event_kind::interrupted: {
        auto old = flags_.modify([](latest_flags& x) {
          if (!x.replacing)
            x.inner_complete = true;
        });
        if (!old.replacing && old.outer_complete)
          complete();
        break;
      }
      case event_kind::completed: {
        auto old = flags_.modify([](latest_flags& x) {
          x.inner_complete = true; //
        });
        if (old.outer_complete)
          complete();
        break;
      }
      case event_kind::next:
      case event_kind::error:
        out_.on_event(what);
        break;
    }
  }

  void complete() {
    RELAY_LOG_FLOW_DEBUG("switch to latest completes");
    out_.on_completed();
  }

  observer<T, E> out_;
  serial_disposable current_;
  atomic_cell<latest_flags> flags_;
};

template <class T, class E>
producer<T, E> flatten_latest(const producer<producer<T, E>, E>& outer) {
  using outer_signal = signal<producer<T, E>, E>;
  using outer_event = event<producer<T, E>, E>;
  return producer<T, E>::make([outer](observer<T, E> out,
                                      composite_disposable root) {
    auto current = serial_disposable::make();
    root.add(current.as_disposable());
    auto state = make_counted<latest_state<T, E>>(std::move(out), current);
    outer.start_with_signal([&](const outer_signal& sig, disposable cancel) {
      root.add(std::move(cancel));
      sig.observe(make_event_observer<producer<T, E>, E>(
        [state](const outer_event& what) { state->on_outer_event(what); }));
    });
  });
}

} // namespace relay::detail
