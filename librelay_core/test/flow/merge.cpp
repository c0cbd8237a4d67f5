// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#include "relay/detail/flatten.hpp"

#include "core-test.hpp"

#include <algorithm>

using namespace relay;
using namespace relay::test;

namespace {

using outer_producer = producer<int_producer, no_error>;

using outer_signal = relay::signal<int_producer, no_error>;

} // namespace

SCENARIO("merge forwards values of all inner producers as they arrive") {
  GIVEN("an outer producer of two hot inner producers") {
    auto [outer, outer_sink] = outer_signal::pipe();
    auto [sig1, sink1] = int_signal::pipe();
    auto [sig2, sink2] = int_signal::pipe();
    recorder<int> rec;
    from_signal(outer)
      .flatten(flatten_strategy::merge)
      .start(rec.as_observer());
    outer_sink.on_next(from_signal(sig1));
    outer_sink.on_next(from_signal(sig2));
    WHEN("the inner producers interleave their values") {
      sink1.on_next(1);
      sink2.on_next(10);
      sink1.on_next(2);
      sink2.on_next(20);
      THEN("the output has the same interleaving") {
        CHECK(rec.values() == std::vector<int>{1, 10, 2, 20});
      }
    }
    WHEN("the outer producer completes first") {
      outer_sink.on_completed();
      sink1.on_completed();
      CHECK(rec.idle());
      sink2.on_next(3);
      sink2.on_completed();
      THEN("the output completes after the last inner producer") {
        CHECK(rec.values() == std::vector<int>{3});
        CHECK(rec.completed());
      }
    }
    WHEN("all inner producers complete before the outer producer") {
      sink1.on_completed();
      sink2.on_completed();
      CHECK(rec.idle());
      outer_sink.on_completed();
      THEN("the output completes with the outer producer") {
        CHECK(rec.completed());
      }
    }
    WHEN("an inner producer is interrupted") {
      sink1.on_interrupted();
      sink2.on_completed();
      outer_sink.on_completed();
      THEN("the interruption counts as completion of that producer") {
        CHECK(rec.completed());
      }
    }
  }
}

SCENARIO("merge forwards errors immediately") {
  GIVEN("two inner producers") {
    auto [outer, outer_sink] = relay::signal<string_error_producer,
                                             std::string>::pipe();
    auto [sig1, sink1] = relay::signal<int, std::string>::pipe();
    recorder<int, std::string> rec;
    from_signal(outer)
      .flatten(flatten_strategy::merge)
      .start(rec.as_observer());
    outer_sink.on_next(from_signal(sig1));
    outer_sink.on_next(string_error_producer::never());
    WHEN("an inner producer fails") {
      sink1.on_error("inner");
      THEN("the output fails right away") {
        CHECK(rec.failed());
        CHECK(rec.error() == std::string{"inner"});
      }
    }
    WHEN("the outer producer fails") {
      outer_sink.on_error("outer");
      THEN("the output fails right away") {
        CHECK(rec.failed());
        CHECK(rec.error() == std::string{"outer"});
      }
    }
  }
}

SCENARIO("cancelling a merged producer disposes all inner producers") {
  GIVEN("a merge of two inner producers that never terminate") {
    auto disposed = std::make_shared<int>(0);
    auto inner = int_producer::never().do_on_disposed([disposed] {
      ++*disposed;
    });
    auto merged = outer_producer::from_container(
                    std::vector<int_producer>{inner, inner})
                    .flatten(flatten_strategy::merge);
    WHEN("cancelling the merged producer") {
      recorder<int> rec;
      auto hdl = merged.start(rec.as_observer());
      CHECK(*disposed == 0);
      hdl.dispose();
      THEN("the observer sees one interruption") {
        CHECK(rec.size() == 1u);
        CHECK(rec.interrupted());
      }
      THEN("each inner producer is disposed exactly once") {
        CHECK(*disposed == 2);
      }
    }
  }
}

SCENARIO("merge completes exactly once with inner producers on many threads") {
  GIVEN("eight producers started on two worker threads") {
    auto worker1 = queue_scheduler::make("merge.worker1");
    auto worker2 = queue_scheduler::make("merge.worker2");
    std::vector<int_producer> inputs;
    for (int i = 0; i < 8; ++i) {
      auto values = std::vector<int>(250, i);
      auto worker = i % 2 == 0 ? worker1 : worker2;
      inputs.push_back(int_producer::from_container(std::move(values))
                         .start_on(worker));
    }
    auto merged = outer_producer::from_container(std::move(inputs))
                    .flatten(flatten_strategy::merge);
    WHEN("collecting all values of the merged producer") {
      for (int round = 0; round < 20; ++round) {
        auto completions = std::make_shared<std::atomic<int>>(0);
        auto res = merged
                     .do_on_completed([completions] { ++*completions; })
                     .collect()
                     .single();
        REQUIRE(res.has_value());
        REQUIRE(res->has_value());
        auto values = res->value();
        CHECK(values.size() == 2000u);
        for (int i = 0; i < 8; ++i)
          CHECK(std::count(values.begin(), values.end(), i) == 250);
        CHECK(completions->load() == 1);
      }
    }
    worker1->stop();
    worker2->stop();
  }
}

SCENARIO("flat_map with merge maps each value to a producer") {
  GIVEN("a producer of 1, 2, 3") {
    THEN("each value expands into its own producer") {
      recorder<int> rec;
      make_counter(3)
        .flat_map(flatten_strategy::merge,
                  [](int x) { return make_counter(x); })
        .start(rec.as_observer());
      CHECK(rec.values() == std::vector<int>{1, 1, 2, 1, 2, 3});
      CHECK(rec.completed());
    }
  }
}

SCENARIO("flatten strategies have names") {
  CHECK(to_string(flatten_strategy::merge) == "merge");
  CHECK(to_string(flatten_strategy::concatenate) == "concatenate");
  CHECK(to_string(flatten_strategy::latest) == "latest");
}
