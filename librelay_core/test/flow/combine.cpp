// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#include "relay/combine.hpp"

#include "core-test.hpp"

#include <tuple>

using namespace relay;
using namespace relay::test;

SCENARIO("combine_latest_with pairs the latest values") {
  GIVEN("two hot producers") {
    auto [sig1, sink1] = int_signal::pipe();
    auto [sig2, sink2] = relay::signal<std::string, no_error>::pipe();
    recorder<std::pair<int, std::string>> rec;
    from_signal(sig1)
      .combine_latest_with(from_signal(sig2))
      .start(rec.as_observer());
    WHEN("both producers emitted values") {
      sink1.on_next(1);
      sink1.on_next(2);
      sink2.on_next("a");
      sink1.on_next(3);
      sink2.on_next("b");
      THEN("the output contains one pair per value after the first pair") {
        using pair_type = std::pair<int, std::string>;
        auto expected = std::vector<pair_type>{{2, "a"}, {3, "a"}, {3, "b"}};
        CHECK(rec.values() == expected);
      }
    }
    WHEN("only one producer completed") {
      sink1.on_next(1);
      sink2.on_next("a");
      sink1.on_completed();
      sink2.on_next("b");
      THEN("the output keeps running") {
        CHECK(rec.values().size() == 2u);
        CHECK(!rec.completed());
      }
      AND_THEN("the output completes once both completed") {
        sink2.on_completed();
        CHECK(rec.completed());
      }
    }
  }
}

SCENARIO("zip_with pairs values by index") {
  GIVEN("two synchronous producers of different length") {
    THEN("the output stops at the shorter producer") {
      recorder<std::pair<int, std::string>> rec;
      auto letters = std::vector<std::string>{"a", "b"};
      make_counter(3)
        .zip_with(producer<std::string, no_error>::from_container(letters))
        .start(rec.as_observer());
      using pair_type = std::pair<int, std::string>;
      auto expected = std::vector<pair_type>{{1, "a"}, {2, "b"}};
      CHECK(rec.values() == expected);
      CHECK(rec.completed());
    }
  }
}

SCENARIO("combine_latest accepts any number of producers") {
  GIVEN("three hot producers") {
    THEN("the output emits tuples once each input emitted") {
      auto [sig1, sink1] = int_signal::pipe();
      auto [sig2, sink2] = int_signal::pipe();
      auto [sig3, sink3] = int_signal::pipe();
      recorder<std::tuple<int, int, int>> rec;
      combine_latest(from_signal(sig1), from_signal(sig2), from_signal(sig3))
        .start(rec.as_observer());
      sink1.on_next(1);
      sink2.on_next(2);
      CHECK(rec.idle());
      sink3.on_next(3);
      sink1.on_next(10);
      auto expected = std::vector<std::tuple<int, int, int>>{{1, 2, 3},
                                                             {10, 2, 3}};
      CHECK(rec.values() == expected);
      sink1.on_completed();
      sink2.on_completed();
      CHECK(!rec.completed());
      sink3.on_completed();
      CHECK(rec.completed());
    }
  }
  GIVEN("a vector of producers") {
    THEN("the output emits vectors") {
      auto inputs = std::vector<int_producer>{int_producer::just(1),
                                              int_producer::just(2),
                                              int_producer::just(3)};
      auto res = combine_latest(inputs).single();
      REQUIRE(res.has_value());
      CHECK(res->value() == std::vector<int>{1, 2, 3});
    }
  }
  GIVEN("an empty vector of producers") {
    THEN("the output completes immediately") {
      recorder<std::vector<int>> rec;
      combine_latest(std::vector<int_producer>{}).start(rec.as_observer());
      CHECK(rec.values().empty());
      CHECK(rec.completed());
    }
  }
}

SCENARIO("zip accepts any number of producers") {
  GIVEN("three synchronous producers") {
    THEN("the output emits tuples of values with the same index") {
      recorder<std::tuple<int, int, std::string>> rec;
      auto words = std::vector<std::string>{"one", "two", "three"};
      zip(make_counter(3), make_counter(2),
          producer<std::string, no_error>::from_container(words))
        .start(rec.as_observer());
      using tuple_type = std::tuple<int, int, std::string>;
      auto expected = std::vector<tuple_type>{{1, 1, "one"}, {2, 2, "two"}};
      CHECK(rec.values() == expected);
      CHECK(rec.completed());
    }
  }
  GIVEN("a vector of producers") {
    THEN("the output emits vectors") {
      auto inputs = std::vector<int_producer>{make_counter(2), make_counter(3)};
      recorder<std::vector<int>> rec;
      zip(inputs).start(rec.as_observer());
      auto expected = std::vector<std::vector<int>>{{1, 1}, {2, 2}};
      CHECK(rec.values() == expected);
      CHECK(rec.completed());
    }
  }
  GIVEN("an empty vector of producers") {
    THEN("the output completes immediately") {
      recorder<std::vector<int>> rec;
      zip(std::vector<int_producer>{}).start(rec.as_observer());
      CHECK(rec.completed());
    }
  }
}
