// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#include "relay/result.hpp"

#include "core-test.hpp"

#include <string>

using namespace relay;

namespace {

using int_result = result<int, std::string>;

} // namespace

SCENARIO("results hold either a value or an error") {
  GIVEN("a successful result") {
    auto x = int_result::success(42);
    THEN("the result has a value") {
      CHECK(x.has_value());
      CHECK(static_cast<bool>(x));
      CHECK(x.value() == 42);
    }
    THEN("map transforms the value") {
      auto y = x.map([](int v) { return std::to_string(v); });
      REQUIRE(y.has_value());
      CHECK(y.value() == "42");
    }
    THEN("map_error leaves the value alone") {
      auto y = x.map_error([](const std::string& e) { return e.size(); });
      CHECK(y == result<int, size_t>::success(42));
    }
    THEN("match calls the success handler") {
      auto str = x.match([](int v) { return "value " + std::to_string(v); },
                         [](const std::string& e) { return "error " + e; });
      CHECK(str == "value 42");
    }
  }
  GIVEN("a failed result") {
    auto x = int_result::failure("oops");
    THEN("the result has an error") {
      CHECK(!x.has_value());
      CHECK(!x);
      CHECK(x.error() == "oops");
    }
    THEN("map leaves the error alone") {
      auto y = x.map([](int v) { return v * 2; });
      CHECK(y == int_result::failure("oops"));
    }
    THEN("map_error transforms the error") {
      auto y = x.map_error([](const std::string& e) { return e.size(); });
      REQUIRE(!y.has_value());
      CHECK(y.error() == 4u);
    }
    THEN("match calls the failure handler") {
      auto str = x.match([](int v) { return "value " + std::to_string(v); },
                         [](const std::string& e) { return "error " + e; });
      CHECK(str == "error oops");
    }
  }
  GIVEN("two results") {
    THEN("equality compares content and state") {
      CHECK(int_result::success(1) == int_result::success(1));
      CHECK(int_result::success(1) != int_result::success(2));
      CHECK(int_result::success(1) != int_result::failure("1"));
    }
    THEN("results with equal value and error types distinguish both states") {
      using same_result = result<int, int>;
      CHECK(same_result::success(1) != same_result::failure(1));
      CHECK(same_result::failure(1).error() == 1);
    }
  }
}
