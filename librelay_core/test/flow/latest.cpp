// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#include "relay/detail/flatten.hpp"

#include "core-test.hpp"

#include <algorithm>
#include <atomic>
#include <memory>

using namespace relay;
using namespace relay::test;

namespace {

using outer_producer = producer<int_producer, no_error>;

using outer_signal = relay::signal<int_producer, no_error>;

} // namespace

SCENARIO("switch to latest forwards only the latest inner producer") {
  GIVEN("an outer producer of hot inner producers") {
    auto [outer, outer_sink] = outer_signal::pipe();
    auto [sig1, sink1] = int_signal::pipe();
    auto [sig2, sink2] = int_signal::pipe();
    recorder<int> rec;
    from_signal(outer)
      .flatten(flatten_strategy::latest)
      .start(rec.as_observer());
    outer_sink.on_next(from_signal(sig1));
    WHEN("a new inner producer arrives") {
      sink1.on_next(1);
      outer_sink.on_next(from_signal(sig2));
      sink1.on_next(2);
      sink2.on_next(3);
      THEN("the output ignores the previous inner producer") {
        CHECK(rec.values() == std::vector<int>{1, 3});
        CHECK(sig1.num_observers() == 0u);
      }
      THEN("the interruption of the previous producer never surfaces") {
        CHECK(rec.count(event_kind::interrupted) == 0u);
      }
    }
    WHEN("the outer producer completes while an inner producer is active") {
      outer_sink.on_completed();
      sink1.on_next(1);
      CHECK(!rec.completed());
      sink1.on_completed();
      THEN("the output completes with the inner producer") {
        CHECK(rec.values() == std::vector<int>{1});
        CHECK(rec.completed());
      }
    }
    WHEN("the active inner producer is interrupted by its source") {
      outer_sink.on_completed();
      sink1.on_interrupted();
      THEN("the interruption counts as inner completion") {
        CHECK(rec.completed());
      }
    }
    WHEN("the inner producer fails") {
      sink1.on_error(no_error{});
      THEN("the output fails") {
        CHECK(rec.count(event_kind::error) == 1u);
      }
    }
  }
  GIVEN("an outer producer that completes without inner producers") {
    THEN("the output completes immediately") {
      recorder<int> rec;
      producer<int_producer, no_error>::empty()
        .flatten(flatten_strategy::latest)
        .start(rec.as_observer());
      CHECK(rec.completed());
    }
  }
}

SCENARIO("switch to latest supersedes a never-ending producer") {
  GIVEN("P1 = [next(1)] without completion and P2 = [next(2), completed]") {
    auto p1 = int_producer::make([](observer<int, no_error> out,
                                    const composite_disposable&) {
      out.on_next(1);
    });
    auto p2 = int_producer::just(2);
    WHEN("the outer producer emits P1 and P2 and then completes") {
      recorder<int> rec;
      producer<int_producer, no_error>::from_container(
        std::vector<int_producer>{p1, p2})
        .flatten(flatten_strategy::latest)
        .start(rec.as_observer());
      THEN("the output is next(1), next(2), completed") {
        CHECK(rec.values() == std::vector<int>{1, 2});
        CHECK(rec.completed());
        CHECK(rec.count(event_kind::interrupted) == 0u);
      }
    }
  }
}

SCENARIO("flat_map with latest restarts on each value") {
  GIVEN("a hot source of values") {
    THEN("only the producer for the latest value contributes") {
      auto [sig, sink] = int_signal::pipe();
      auto [inner1, inner_sink1] = int_signal::pipe();
      auto [inner2, inner_sink2] = int_signal::pipe();
      auto inners = std::vector<int_signal>{inner1, inner2};
      recorder<int> rec;
      from_signal(sig)
        .flat_map(flatten_strategy::latest,
                  [inners](int x) { return from_signal(inners[x]); })
        .start(rec.as_observer());
      sink.on_next(0);
      inner_sink1.on_next(10);
      sink.on_next(1);
      inner_sink1.on_next(11);
      inner_sink2.on_next(20);
      sink.on_completed();
      inner_sink2.on_completed();
      CHECK(rec.values() == std::vector<int>{10, 20});
      CHECK(rec.completed());
    }
  }
}

SCENARIO("switch to latest completes once with producers on many threads") {
  GIVEN("eight producers started on two alternating worker threads") {
    auto worker1 = queue_scheduler::make("latest.worker1");
    auto worker2 = queue_scheduler::make("latest.worker2");
    std::vector<int_producer> inputs;
    for (int i = 0; i < 8; ++i) {
      auto worker = i % 2 == 0 ? worker1 : worker2;
      inputs.push_back(int_producer::from_container(std::vector<int>(250, i))
                         .start_on(worker));
    }
    auto latest = outer_producer::from_container(std::move(inputs))
                    .flatten(flatten_strategy::latest);
    WHEN("collecting all values of the switching producer") {
      for (int round = 0; round < 20; ++round) {
        auto completions = std::make_shared<std::atomic<int>>(0);
        auto res = latest.do_on_completed([completions] { ++*completions; })
                     .collect()
                     .single();
        REQUIRE(res.has_value());
        REQUIRE(res->has_value());
        auto values = res->value();
        REQUIRE(values.size() >= 250u);
        CHECK(std::count(values.begin(), values.end(), 7) == 250);
        CHECK(std::all_of(values.end() - 250, values.end(),
                          [](int x) { return x == 7; }));
        CHECK(completions->load() == 1);
      }
    }
    worker1->stop();
    worker2->stop();
  }
}
