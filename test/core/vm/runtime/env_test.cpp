/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "vm/runtime/env.hpp"

#include <gtest/gtest.h>

#include "testutil/literals.hpp"
#include "testutil/vm/system_fixture.hpp"

using fibon::primitives::TokenAmount;
using fibon::primitives::address::Address;
using fibon::testutil::vm::SystemFixture;
using fibon::vm::VMExitCode;
using fibon::vm::actor::kSendMethodNumber;
using fibon::vm::message::UnsignedMessage;
using fibon::vm::runtime::MessageReceipt;

class EnvTest : public SystemFixture {
 public:
  MessageReceipt applyTransfer(const Address &from,
                               const Address &to,
                               const TokenAmount &value,
                               const fibon::Bytes &params = {}) {
    EXPECT_OUTCOME_TRUE(
        receipt,
        env->applyMessage(
            UnsignedMessage{to, from, value, kSendMethodNumber, params}));
    return receipt;
  }

  TokenAmount balance(const Address &address) {
    EXPECT_OUTCOME_TRUE(actor, env->state_tree->get(address));
    return actor.balance;
  }
};

/**
 * @given Two accounts
 * @when transfer value with method 0
 * @then balances moved
 */
TEST_F(EnvTest, Transfer) {
  const auto to{account(0)};
  const auto receipt{applyTransfer(owners[0], to, 400)};
  EXPECT_EQ(receipt.exit_code, VMExitCode::kOk);
  EXPECT_EQ(balance(owners[0]), 600);
  EXPECT_EQ(balance(to), 400);
}

/**
 * @given Account
 * @when transfer more than balance, to missing actor, or negative value
 * @then message fails and balances are unchanged
 */
TEST_F(EnvTest, TransferFails) {
  const auto to{account(0)};
  EXPECT_EQ(applyTransfer(owners[0], to, 1001).exit_code,
            VMExitCode::kSysErrInsufficientFunds);
  EXPECT_EQ(applyTransfer(owners[0], Address::makeFromId(999), 1).exit_code,
            VMExitCode::kSysErrInvalidReceiver);
  EXPECT_EQ(applyTransfer(owners[0], to, -1).exit_code,
            VMExitCode::kSysErrForbidden);
  EXPECT_EQ(balance(owners[0]), 1000);
  EXPECT_EQ(balance(to), 0);
}

/**
 * @given Multisig actor
 * @when method 0 is sent with value and non-empty payload
 * @then message rejected, value transfer reverted
 */
TEST_F(EnvTest, TransferWithPayloadReverted) {
  const auto receipt{applyTransfer(owners[0], multisig_address, 10, "01"_unhex)};
  EXPECT_EQ(receipt.exit_code, VMExitCode::kSysErrInvalidMethod);
  EXPECT_TRUE(receipt.events.empty());
  EXPECT_EQ(balance(owners[0]), 1000);
  EXPECT_EQ(balance(multisig_address), treasury);
}

/**
 * @given Message from actor that is not account
 * @when apply
 * @then sender invalid
 */
TEST_F(EnvTest, SenderNotAccount) {
  EXPECT_EQ(applyTransfer(multisig_address, owners[0], 1).exit_code,
            VMExitCode::kSysErrSenderInvalid);
  EXPECT_EQ(applyTransfer(Address::makeFromId(999), owners[0], 1).exit_code,
            VMExitCode::kSysErrSenderInvalid);
}

/**
 * @given Transfer message
 * @when call it without applying
 * @then receipt is returned, state unchanged
 */
TEST_F(EnvTest, CallReverts) {
  EXPECT_OUTCOME_TRUE(
      receipt,
      env->call(UnsignedMessage{
          owners[1], owners[0], 100, kSendMethodNumber, {}}));
  EXPECT_EQ(receipt.exit_code, VMExitCode::kOk);
  EXPECT_EQ(balance(owners[0]), 1000);
  EXPECT_EQ(balance(owners[1]), 1000);
}

/**
 * @given Multisig constructor params with threshold greater than signers
 * @when deploy actor
 * @then deploy fails and no actor is created
 */
TEST_F(EnvTest, DeployFailureLeavesNoActor) {
  const auto before{env->state_tree->actorAddresses()};
  EXPECT_OUTCOME_TRUE(
      params,
      fibon::vm::actor::encodeActorParams(
          fibon::testutil::vm::multisig::Construct::Params{{owners[0]}, 2}));
  EXPECT_OUTCOME_ERROR(
      VMExitCode::kErrIllegalArgument,
      env->deployActor(
          fibon::vm::actor::builtin::kMultisigCodeId, params, 0));
  EXPECT_EQ(env->state_tree->actorAddresses(), before);
}
