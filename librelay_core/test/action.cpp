// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#include "relay/action.hpp"

#include "core-test.hpp"

using namespace relay;

SCENARIO("actions run until disposed") {
  GIVEN("an action that counts its runs") {
    auto runs = std::make_shared<int>(0);
    auto act = make_action([runs] { ++*runs; });
    WHEN("running it twice") {
      act.run();
      act.run();
      THEN("the function runs twice and the action remains scheduled") {
        CHECK(*runs == 2);
        CHECK(act.scheduled());
      }
    }
    WHEN("disposing it") {
      act.dispose();
      act.run();
      THEN("the function never runs") {
        CHECK(*runs == 0);
        CHECK(act.disposed());
      }
    }
  }
  GIVEN("an action that disposes itself while running") {
    THEN("the action switches to disposed after the run") {
      auto self = std::make_shared<action>();
      *self = make_action([self] { self->dispose(); });
      self->run();
      CHECK(self->disposed());
      CHECK(self->ptr()->current_state() == action::state::disposed);
      *self = nullptr;
    }
  }
}

SCENARIO("beacons release waiting threads") {
  GIVEN("a beacon") {
    auto gate = make_counted<detail::beacon>();
    WHEN("running it") {
      gate->run();
      THEN("wait returns lit immediately") {
        CHECK(gate->wait() == detail::beacon::state::lit);
        CHECK(gate->current_state() == action::state::scheduled);
      }
    }
    WHEN("disposing it") {
      gate->dispose();
      THEN("wait returns disposed") {
        CHECK(gate->disposed());
        CHECK(gate->current_state() == action::state::disposed);
        CHECK(gate->wait() == detail::beacon::state::disposed);
      }
    }
    WHEN("nobody runs it") {
      THEN("wait_for times out") {
        auto res = gate->wait_for(std::chrono::milliseconds(1));
        CHECK(res == detail::beacon::state::waiting);
      }
    }
  }
}
