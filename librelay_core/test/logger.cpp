// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#include "relay/logger.hpp"

#include "core-test.hpp"

#include <sstream>
#include <stdexcept>

#include "relay/raise_error.hpp"

using namespace relay;
using namespace std::literals;

namespace {

// Installs a logger for the current scope.
class scoped_logger {
public:
  explicit scoped_logger(intrusive_ptr<logger> instance)
    : prev_(logger::current_logger(std::move(instance))) {
    // nop
  }

  ~scoped_logger() {
    logger::current_logger(std::move(prev_));
  }

private:
  intrusive_ptr<logger> prev_;
};

bool contains(const std::string& str, const std::string& what) {
  return str.find(what) != std::string::npos;
}

} // namespace

SCENARIO("line builders join their input with spaces") {
  GIVEN("a line builder") {
    THEN("streaming values renders them separated by a single space") {
      auto answer = 42;
      auto str = (logger::line_builder{} << "answer:" << answer << true).get();
      CHECK(str == "answer: 42 true");
    }
    THEN("RELAY_ARG renders arguments as name-value pairs") {
      auto count = 3;
      auto str = (logger::line_builder{} << RELAY_ARG(count)
                                         << RELAY_ARG2("kind",
                                                       event_kind::completed))
                   .get();
      CHECK(str == "count = 3 kind = completed");
    }
  }
}

SCENARIO("stream loggers filter by level and component") {
  GIVEN("a logger for debug output of relay.flow") {
    std::ostringstream out;
    auto lg = logger::make_stream_logger(out, RELAY_LOG_LEVEL_DEBUG,
                                         {"relay.flow"});
    THEN("the logger accepts levels up to its verbosity") {
      CHECK(lg->accepts(RELAY_LOG_LEVEL_ERROR, "relay.flow"));
      CHECK(lg->accepts(RELAY_LOG_LEVEL_DEBUG, "relay.flow"));
      CHECK(!lg->accepts(RELAY_LOG_LEVEL_TRACE, "relay.flow"));
      CHECK(!lg->accepts(RELAY_LOG_LEVEL_QUIET, "relay.flow"));
    }
    THEN("the logger accepts the component and its sub-components") {
      CHECK(lg->accepts(RELAY_LOG_LEVEL_DEBUG, "relay.flow.merge"));
      CHECK(!lg->accepts(RELAY_LOG_LEVEL_DEBUG, "relay"));
      CHECK(!lg->accepts(RELAY_LOG_LEVEL_DEBUG, "relay.flowchart"));
    }
    WHEN("logging through the current logger") {
      scoped_logger guard{lg};
      RELAY_LOG_IMPL("relay.flow", RELAY_LOG_LEVEL_DEBUG,
                     "merged" << RELAY_ARG2("inputs", 2));
      RELAY_LOG_IMPL("relay.io", RELAY_LOG_LEVEL_DEBUG, "dropped");
      RELAY_LOG_IMPL("relay.flow", RELAY_LOG_LEVEL_TRACE, "dropped");
      THEN("only accepted lines appear in the output") {
        auto str = out.str();
        CHECK(contains(str, "DEBUG relay.flow logger.cpp:"));
        CHECK(contains(str, " merged inputs = 2\n"));
        CHECK(!contains(str, "dropped"));
      }
    }
  }
  GIVEN("a logger without component filter") {
    THEN("the logger accepts all components") {
      std::ostringstream out;
      auto lg = logger::make_stream_logger(out, RELAY_LOG_LEVEL_INFO);
      CHECK(lg->accepts(RELAY_LOG_LEVEL_INFO, "relay"));
      CHECK(lg->accepts(RELAY_LOG_LEVEL_INFO, "app.ui"));
      CHECK(!lg->accepts(RELAY_LOG_LEVEL_DEBUG, "relay"));
    }
  }
}

SCENARIO("log levels have printable names") {
  CHECK(logger::level_name(RELAY_LOG_LEVEL_ERROR) == "ERROR"s);
  CHECK(logger::level_name(RELAY_LOG_LEVEL_WARNING) == "WARNING"s);
  CHECK(logger::level_name(RELAY_LOG_LEVEL_INFO) == "INFO"s);
  CHECK(logger::level_name(RELAY_LOG_LEVEL_DEBUG) == "DEBUG"s);
  CHECK(logger::level_name(RELAY_LOG_LEVEL_TRACE) == "TRACE"s);
  CHECK(logger::level_name(RELAY_LOG_LEVEL_QUIET) == "QUIET"s);
}

SCENARIO("RELAY_RAISE_ERROR logs the error before throwing") {
  GIVEN("a logger for errors") {
    std::ostringstream out;
    auto lg = logger::make_stream_logger(out, RELAY_LOG_LEVEL_ERROR);
    scoped_logger guard{lg};
    THEN("raising with an exception type throws that type") {
      auto fn = [] { RELAY_RAISE_ERROR(std::invalid_argument, "bad input"); };
      CHECK_THROWS_AS(fn(), std::invalid_argument);
      CHECK(contains(out.str(), "ERROR relay logger.cpp:"));
      CHECK(contains(out.str(), " bad input\n"));
    }
    THEN("raising with only a message throws a runtime_error") {
      auto fn = [] { RELAY_RAISE_ERROR("broken invariant"); };
      CHECK_THROWS_AS(fn(), std::runtime_error);
      CHECK(contains(out.str(), "broken invariant"));
    }
  }
}
