// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#include "relay/producer.hpp"

#include "core-test.hpp"

using namespace relay;
using namespace relay::test;

namespace {

/// Fails on the first `failures` starts and emits the start count afterwards.
string_error_producer flaky(int failures, std::shared_ptr<int> starts) {
  return string_error_producer::make(
    [failures, starts](observer<int, std::string> out,
                       const composite_disposable&) {
      if (++*starts <= failures) {
        out.on_error("failure #" + std::to_string(*starts));
        return;
      }
      out.on_next(*starts);
      out.on_completed();
    });
}

} // namespace

SCENARIO("concat appends a producer") {
  GIVEN("two synchronous producers") {
    THEN("the output contains the values of both in order") {
      recorder<int> rec;
      make_counter(2).concat(int_producer::just(7)).start(rec.as_observer());
      CHECK(rec.values() == std::vector<int>{1, 2, 7});
      CHECK(rec.completed());
    }
  }
}

SCENARIO("then replaces the values of a producer") {
  GIVEN("a producer that completes after three values") {
    THEN("the output contains only the values of the replacement") {
      recorder<std::string> rec;
      auto replacement = producer<std::string, no_error>::just("done");
      make_counter(3).then(replacement).start(rec.as_observer());
      CHECK(rec.values() == std::vector<std::string>{"done"});
      CHECK(rec.completed());
    }
  }
  GIVEN("a producer that fails") {
    THEN("the output fails without starting the replacement") {
      auto [replacement, starts] = count_starts(string_error_producer::just(1));
      recorder<int, std::string> rec;
      string_error_producer::fail("broken")
        .then(replacement)
        .start(rec.as_observer());
      CHECK(rec.failed());
      CHECK(*starts == 0u);
    }
  }
}

SCENARIO("times repeats a producer") {
  GIVEN("a producer of 1, 2") {
    auto src = make_counter(2);
    WHEN("repeating it three times") {
      recorder<int> rec;
      auto [counted, starts] = count_starts(src);
      counted.times(3).start(rec.as_observer());
      THEN("the output contains three runs and completes once") {
        CHECK(rec.values() == std::vector<int>{1, 2, 1, 2, 1, 2});
        CHECK(rec.completed());
        CHECK(*starts == 3u);
      }
    }
    WHEN("repeating it zero times") {
      recorder<int> rec;
      auto [counted, starts] = count_starts(src);
      counted.times(0).start(rec.as_observer());
      THEN("the output completes without starting the producer") {
        CHECK(rec.values().empty());
        CHECK(rec.completed());
        CHECK(*starts == 0u);
      }
    }
    WHEN("repeating it once") {
      recorder<int> rec;
      src.times(1).start(rec.as_observer());
      THEN("the output equals the producer") {
        CHECK(rec.values() == std::vector<int>{1, 2});
        CHECK(rec.completed());
      }
    }
  }
  GIVEN("a producer that fails") {
    THEN("times forwards the error without restarting") {
      auto starts = std::make_shared<int>(0);
      recorder<int, std::string> rec;
      flaky(10, starts).times(3).start(rec.as_observer());
      CHECK(rec.failed());
      CHECK(*starts == 1);
    }
  }
  GIVEN("a repeated producer that the consumer cancels") {
    THEN("the current run is interrupted and no further run starts") {
      auto [src, sink] = int_signal::pipe();
      auto [counted, starts] = count_starts(from_signal(src));
      recorder<int> rec;
      auto hdl = counted.times(5).start(rec.as_observer());
      sink.on_next(1);
      hdl.dispose();
      CHECK(rec.values() == std::vector<int>{1});
      CHECK(rec.interrupted());
      CHECK(*starts == 1u);
    }
  }
}

SCENARIO("retry restarts a producer after errors") {
  GIVEN("a producer that fails twice") {
    WHEN("retrying it twice") {
      auto starts = std::make_shared<int>(0);
      recorder<int, std::string> rec;
      flaky(2, starts).retry(2).start(rec.as_observer());
      THEN("the third start succeeds") {
        CHECK(rec.values() == std::vector<int>{3});
        CHECK(rec.completed());
        CHECK(*starts == 3);
      }
    }
    WHEN("retrying it once") {
      auto starts = std::make_shared<int>(0);
      recorder<int, std::string> rec;
      flaky(2, starts).retry(1).start(rec.as_observer());
      THEN("the second error reaches the observer") {
        CHECK(rec.failed());
        CHECK(rec.error() == std::string{"failure #2"});
        CHECK(*starts == 2);
      }
    }
    WHEN("retrying it zero times") {
      auto starts = std::make_shared<int>(0);
      recorder<int, std::string> rec;
      flaky(2, starts).retry(0).start(rec.as_observer());
      THEN("the first error reaches the observer") {
        CHECK(rec.error() == std::string{"failure #1"});
        CHECK(*starts == 1);
      }
    }
  }
}

SCENARIO("flat_map_error replaces a failed producer") {
  GIVEN("a producer that fails after one value") {
    auto src = string_error_producer::make(
      [](observer<int, std::string> out, const composite_disposable&) {
        out.on_next(1);
        out.on_error("oops");
      });
    WHEN("handling the error with a producer that cannot fail") {
      recorder<int> rec;
      src
        .flat_map_error([](const std::string& what) {
          return int_producer::just(static_cast<int>(what.size()));
        })
        .start(rec.as_observer());
      THEN("the output continues with the replacement") {
        CHECK(rec.values() == std::vector<int>{1, 4});
        CHECK(rec.completed());
      }
    }
    WHEN("handling the error with a failing producer") {
      recorder<int, int> rec;
      src
        .flat_map_error([](const std::string&) {
          return producer<int, int>::fail(42);
        })
        .start(rec.as_observer());
      THEN("the output fails with the new error type") {
        CHECK(rec.values() == std::vector<int>{1});
        CHECK(rec.error() == 42);
      }
    }
  }
  GIVEN("a producer that completes") {
    THEN("the handler never runs") {
      auto calls = std::make_shared<int>(0);
      recorder<int> rec;
      make_counter(2)
        .promote_errors<std::string>()
        .flat_map_error([calls](const std::string&) {
          ++*calls;
          return int_producer::empty();
        })
        .start(rec.as_observer());
      CHECK(rec.values() == std::vector<int>{1, 2});
      CHECK(rec.completed());
      CHECK(*calls == 0);
    }
  }
  GIVEN("a failing producer whose replacement never terminates") {
    THEN("cancelling disposes the replacement") {
      auto disposed = std::make_shared<bool>(false);
      recorder<int> rec;
      auto hdl = string_error_producer::fail("x")
                   .flat_map_error([disposed](const std::string&) {
                     return int_producer::never().do_on_disposed(
                       [disposed] { *disposed = true; });
                   })
                   .start(rec.as_observer());
      CHECK(!*disposed);
      hdl.dispose();
      CHECK(*disposed);
      CHECK(rec.interrupted());
    }
  }
}
