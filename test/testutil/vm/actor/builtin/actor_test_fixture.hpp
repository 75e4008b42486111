/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gtest/gtest.h>

#include "codec/cbor/cbor_codec.hpp"
#include "primitives/address/address.hpp"
#include "primitives/types.hpp"
#include "testutil/literals.hpp"
#include "testutil/mocks/vm/runtime/runtime_mock.hpp"
#include "testutil/outcome.hpp"
#include "vm/actor/actor.hpp"

namespace fibon::testutil::vm::actor::builtin {
  using ::fibon::vm::actor::CodeId;
  using ::fibon::vm::runtime::ActorEvent;
  using ::fibon::vm::runtime::MockRuntime;
  using primitives::TokenAmount;
  using primitives::UnixTime;
  using primitives::address::Address;
  using testing::_;
  using testing::Return;

  /**
   * Fixture class for actor testing
   */
  template <typename State>
  class ActorTestFixture : public testing::Test {
   public:
    void SetUp() override {
      EXPECT_CALL(runtime, commit(_))
          .WillRepeatedly(testing::Invoke([&](auto &encoded) {
            EXPECT_OUTCOME_TRUE(new_state,
                                codec::cbor::decode<State>(encoded));
            state = std::move(new_state);
            return outcome::success();
          }));

      EXPECT_CALL(runtime, getActorHead())
          .WillRepeatedly(testing::Invoke([&]() {
            return codec::cbor::encode(state);
          }));

      EXPECT_CALL(runtime, emitEvent(_, _))
          .WillRepeatedly(testing::Invoke([&](auto name, auto &data) {
            events.push_back(
                ActorEvent{actor_address, std::string{name}, data});
            return outcome::success();
          }));

      EXPECT_CALL(runtime, getCurrentReceiver())
          .WillRepeatedly(testing::Invoke([&]() { return actor_address; }));

      EXPECT_CALL(runtime, getCurrentTime())
          .WillRepeatedly(testing::Invoke([&]() { return current_time; }));

      EXPECT_CALL(runtime, getValueReceived())
          .WillRepeatedly(testing::Invoke([&]() { return value_received; }));

      EXPECT_CALL(runtime, getBalance(_))
          .WillRepeatedly(testing::Invoke([&](auto &) {
            return outcome::result<TokenAmount>{balance};
          }));
    }

    void callerIs(const Address &caller) {
      EXPECT_CALL(runtime, getImmediateCaller()).WillRepeatedly(Return(caller));
    }

    void currentTimeIs(UnixTime time) {
      current_time = time;
    }

    /// Names of emitted events in order
    std::vector<std::string> eventNames() const {
      std::vector<std::string> names;
      for (const auto &event : events) {
        names.push_back(event.name);
      }
      return names;
    }

    MockRuntime runtime;
    State state;
    Address actor_address{1000_id};
    UnixTime current_time{};
    TokenAmount value_received{};
    TokenAmount balance{};
    std::vector<ActorEvent> events;
  };
}  // namespace fibon::testutil::vm::actor::builtin
