// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#include "relay/producer.hpp"

#include "core-test.hpp"

#include <thread>

using namespace relay;
using namespace relay::test;

namespace {

using int_result = result<int, std::string>;

} // namespace

SCENARIO("single returns the only value of a producer") {
  GIVEN("a producer with exactly one value") {
    THEN("single returns that value") {
      auto res = int_producer::just(42).single();
      REQUIRE(res.has_value());
      CHECK(res->has_value());
      CHECK(res->value() == 42);
    }
  }
  GIVEN("a producer with two values") {
    THEN("single returns nothing") {
      CHECK(!make_counter(2).single().has_value());
    }
  }
  GIVEN("a producer without values") {
    THEN("single returns nothing") {
      CHECK(!int_producer::empty().single().has_value());
    }
  }
  GIVEN("a producer that fails") {
    THEN("single returns the failure") {
      auto res = string_error_producer::fail("boom").single();
      REQUIRE(res.has_value());
      CHECK(*res == int_result::failure("boom"));
    }
  }
  GIVEN("a producer that emits a value and then fails") {
    THEN("single returns the failure") {
      auto src = string_error_producer::make(
        [](observer<int, std::string> out, const composite_disposable&) {
          out.on_next(1);
          out.on_error("late");
        });
      auto res = src.single();
      REQUIRE(res.has_value());
      CHECK(*res == int_result::failure("late"));
    }
  }
  GIVEN("a producer that runs on another thread") {
    THEN("single blocks until the producer terminates") {
      auto worker = queue_scheduler::make("single.worker");
      auto src = int_producer::make([](observer<int, no_error> out,
                                       const composite_disposable&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        out.on_next(7);
        out.on_completed();
      });
      auto res = src.start_on(worker).single();
      REQUIRE(res.has_value());
      CHECK(res->value() == 7);
      worker->stop();
    }
  }
}

SCENARIO("first and last pick a single value") {
  GIVEN("a producer of 1, 2, 3") {
    auto src = make_counter(3);
    THEN("first returns 1") {
      auto res = src.first();
      REQUIRE(res.has_value());
      CHECK(res->value() == 1);
    }
    THEN("last returns 3") {
      auto res = src.last();
      REQUIRE(res.has_value());
      CHECK(res->value() == 3);
    }
  }
  GIVEN("an empty producer") {
    THEN("first and last return nothing") {
      CHECK(!int_producer::empty().first().has_value());
      CHECK(!int_producer::empty().last().has_value());
    }
  }
  GIVEN("an infinite producer") {
    THEN("first cancels the producer after one value") {
      auto src = int_producer::make([](observer<int, no_error> out,
                                       composite_disposable root) {
        for (int i = 1; !root.disposed(); ++i)
          out.on_next(i);
      });
      auto res = src.first();
      REQUIRE(res.has_value());
      CHECK(res->value() == 1);
    }
  }
}

SCENARIO("wait blocks until a producer terminates") {
  GIVEN("a producer that completes") {
    THEN("wait returns success") {
      auto res = make_counter(5).wait();
      CHECK(res.has_value());
    }
  }
  GIVEN("a producer that completes without values") {
    THEN("wait returns success") {
      CHECK(int_producer::empty().wait().has_value());
    }
  }
  GIVEN("a producer that fails") {
    THEN("wait returns the error") {
      auto res = string_error_producer::fail("nope").wait();
      REQUIRE(!res.has_value());
      CHECK(res.error() == "nope");
    }
  }
}
