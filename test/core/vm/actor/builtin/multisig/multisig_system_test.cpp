/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include "testutil/vm/system_fixture.hpp"
#include "vm/actor/builtin/multisig/multisig_events.hpp"

using fibon::primitives::TokenAmount;
using fibon::primitives::address::Address;
using fibon::testutil::vm::SystemFixture;
using fibon::vm::VMExitCode;
using fibon::vm::actor::decodeActorEvent;
using fibon::vm::actor::encodeActorParams;
using fibon::vm::actor::kSendMethodNumber;
using namespace fibon::vm::actor::builtin::multisig;
namespace token = fibon::vm::actor::builtin::token;

class MultisigSystemTest : public SystemFixture {
 public:
  TokenAmount balance(const Address &address) {
    EXPECT_OUTCOME_TRUE(actor, env->state_tree->get(address));
    return actor.balance;
  }

  Transaction transaction(TransactionId tx_id) {
    return call<GetTransaction>(multisig_address, {tx_id});
  }

  /// Submit of plain transfer by owner with value attached
  fibon::vm::runtime::MessageReceipt submitTransfer(const Address &from,
                                                    const Address &to,
                                                    const TokenAmount &value) {
    return apply<Submit>(
        from, multisig_address, {to, value, kSendMethodNumber, {}}, value);
  }
};

/**
 * @given 3 owners with threshold 2
 * @when owner submits transfer of 1 with value attached and second owner
 * approves
 * @then transfer is executed once, third approval fails
 */
TEST_F(MultisigSystemTest, ScenarioA) {
  const auto receiver{account(0)};
  const auto treasury_before{balance(multisig_address)};

  const auto submitted{result<Submit>(submitTransfer(owners[0], receiver, 1))};
  EXPECT_FALSE(submitted.applied);
  EXPECT_FALSE(transaction(submitted.tx_id).executed);
  EXPECT_EQ(transaction(submitted.tx_id).approved.size(), size_t{1});
  EXPECT_EQ(balance(multisig_address), TokenAmount{treasury_before + 1});

  const auto receipt{
      apply<Approve>(owners[1], multisig_address, {submitted.tx_id})};
  const auto approved{result<Approve>(receipt)};
  EXPECT_TRUE(approved.applied);
  EXPECT_EQ(approved.code, VMExitCode::kOk);
  EXPECT_EQ(eventNames(receipt),
            (std::vector<std::string>{"Confirmation", "Execution"}));
  EXPECT_EQ(balance(receiver), 1);
  EXPECT_EQ(balance(multisig_address), treasury_before);
  EXPECT_TRUE(transaction(submitted.tx_id).executed);

  const auto third{
      apply<Approve>(owners[2], multisig_address, {submitted.tx_id})};
  EXPECT_EQ(third.exit_code, VMExitCode::kErrIllegalState);
  EXPECT_EQ(balance(receiver), 1);
}

/**
 * @given Pending transaction approved by first owner
 * @when same owner approves again
 * @then approval fails, approval count unchanged
 */
TEST_F(MultisigSystemTest, DoubleApprove) {
  const auto submitted{
      result<Submit>(submitTransfer(owners[0], owners[2], 0))};
  const auto receipt{
      apply<Approve>(owners[0], multisig_address, {submitted.tx_id})};
  EXPECT_EQ(receipt.exit_code, VMExitCode::kErrForbidden);
  EXPECT_TRUE(receipt.events.empty());
  EXPECT_EQ(transaction(submitted.tx_id).approved.size(), size_t{1});
  EXPECT_TRUE(
      call<IsApproved>(multisig_address, {submitted.tx_id, owners[0]}));
  EXPECT_FALSE(
      call<IsApproved>(multisig_address, {submitted.tx_id, owners[1]}));
}

/**
 * @given Account that is not owner
 * @when it submits, approves or withdraws
 * @then forbidden
 */
TEST_F(MultisigSystemTest, NotOwner) {
  EXPECT_EQ(submitTransfer(outsider, outsider, 0).exit_code,
            VMExitCode::kErrForbidden);
  const auto submitted{
      result<Submit>(submitTransfer(owners[0], owners[2], 0))};
  EXPECT_EQ(
      apply<Approve>(outsider, multisig_address, {submitted.tx_id}).exit_code,
      VMExitCode::kErrForbidden);
  EXPECT_EQ(apply<SubmitWithdrawal>(outsider, multisig_address, {outsider, 1})
                .exit_code,
            VMExitCode::kErrForbidden);
  EXPECT_EQ(
      apply<Approve>(owners[1], multisig_address, {submitted.tx_id + 1})
          .exit_code,
      VMExitCode::kErrNotFound);
}

/**
 * @given Submit with value not equal to attached funds
 * @when apply
 * @then illegal argument, funds returned to sender
 */
TEST_F(MultisigSystemTest, SubmitValueMismatch) {
  const auto receipt{apply<Submit>(
      owners[0], multisig_address, {owners[2], 10, kSendMethodNumber, {}}, 5)};
  EXPECT_EQ(receipt.exit_code, VMExitCode::kErrIllegalArgument);
  EXPECT_EQ(balance(owners[0]), 1000);
  EXPECT_EQ(call<GetTransactionCount>(multisig_address, {true, true}), 0);
}

/**
 * @given Destination call that always fails and value reserved in wallet
 * @when transaction is approved and executed repeatedly
 * @then executed stays false, every attempt emits failure, value stays in
 * wallet
 */
TEST_F(MultisigSystemTest, ScenarioE) {
  const auto treasury_before{balance(multisig_address)};
  EXPECT_OUTCOME_TRUE(
      payload,
      encodeActorParams(token::Transfer::Params{owners[2], 100}));
  const auto submitted{result<Submit>(
      apply<Submit>(owners[0],
                    multisig_address,
                    {token_address, 7, token::Transfer::Number, payload},
                    7))};

  const auto receipt{
      apply<Approve>(owners[1], multisig_address, {submitted.tx_id})};
  const auto approved{result<Approve>(receipt)};
  EXPECT_TRUE(approved.applied);
  EXPECT_EQ(approved.code, VMExitCode::kErrInsufficientFunds);
  EXPECT_EQ(eventNames(receipt),
            (std::vector<std::string>{"Confirmation", "ExecutionFailure"}));
  EXPECT_OUTCOME_TRUE(failure,
                      decodeActorEvent<ExecutionFailureEvent>(receipt.events[1]));
  EXPECT_EQ(failure.tx_id, submitted.tx_id);

  for (auto i{0}; i < 3; ++i) {
    const auto retry{
        apply<Execute>(outsider, multisig_address, {submitted.tx_id})};
    const auto executed{result<Execute>(retry)};
    EXPECT_TRUE(executed.applied);
    EXPECT_EQ(executed.code, VMExitCode::kErrInsufficientFunds);
    EXPECT_EQ(eventNames(retry),
              (std::vector<std::string>{"ExecutionFailure"}));
  }

  EXPECT_FALSE(transaction(submitted.tx_id).executed);
  EXPECT_EQ(balance(multisig_address), TokenAmount{treasury_before + 7});
  EXPECT_EQ(balance(token_address), 0);
  EXPECT_EQ(call<GetTransactionCount>(multisig_address, {true, false}), 1);
}

/**
 * @given Approved token transfer that failed for lack of wallet tokens
 * @when wallet receives tokens and anyone executes the transaction twice
 * @then first execute succeeds and moves value once, second is rejected
 */
TEST_F(MultisigSystemTest, ExecuteAfterShortfallFixed) {
  const auto treasury_before{balance(multisig_address)};
  const auto receiver{owners[2]};
  EXPECT_OUTCOME_TRUE(
      payload, encodeActorParams(token::Transfer::Params{receiver, 100}));
  const auto submitted{result<Submit>(
      apply<Submit>(owners[0],
                    multisig_address,
                    {token_address, 7, token::Transfer::Number, payload},
                    7))};
  const auto approved{approve(owners[1], submitted.tx_id)};
  EXPECT_TRUE(approved.applied);
  EXPECT_EQ(approved.code, VMExitCode::kErrInsufficientFunds);
  EXPECT_FALSE(transaction(submitted.tx_id).executed);

  EXPECT_EQ(admin<token::Mint>(token_address, {multisig_address, 100}),
            VMExitCode::kOk);

  const auto receipt{
      apply<Execute>(outsider, multisig_address, {submitted.tx_id})};
  const auto executed{result<Execute>(receipt)};
  EXPECT_TRUE(executed.applied);
  EXPECT_EQ(executed.code, VMExitCode::kOk);
  EXPECT_EQ(eventNames(receipt), (std::vector<std::string>{"Execution"}));
  EXPECT_TRUE(transaction(submitted.tx_id).executed);
  EXPECT_EQ(tokenBalance(receiver), 100);
  EXPECT_EQ(tokenBalance(multisig_address), 0);
  EXPECT_EQ(balance(token_address), 7);
  EXPECT_EQ(balance(multisig_address), treasury_before);

  const auto again{
      apply<Execute>(outsider, multisig_address, {submitted.tx_id})};
  EXPECT_EQ(again.exit_code, VMExitCode::kErrIllegalState);
  EXPECT_TRUE(again.events.empty());
  EXPECT_EQ(tokenBalance(receiver), 100);
  EXPECT_EQ(balance(token_address), 7);
  EXPECT_EQ(balance(multisig_address), treasury_before);
}

/**
 * @given Transaction with one approval of two required
 * @when anyone executes it
 * @then forbidden, destination not called
 */
TEST_F(MultisigSystemTest, ExecuteBelowThreshold) {
  const auto receiver{account(0)};
  const auto submitted{
      result<Submit>(submitTransfer(owners[0], receiver, 3))};
  EXPECT_EQ(
      apply<Execute>(outsider, multisig_address, {submitted.tx_id}).exit_code,
      VMExitCode::kErrForbidden);
  EXPECT_EQ(balance(receiver), 0);
}

/**
 * @given Wallet holding treasury
 * @when owners withdraw through SubmitWithdrawal
 * @then funds of wallet are transferred, overdraft rejected at submission
 */
TEST_F(MultisigSystemTest, Withdrawal) {
  const auto receiver{account(0)};
  EXPECT_EQ(apply<SubmitWithdrawal>(
                owners[0], multisig_address, {receiver, treasury + 1})
                .exit_code,
            VMExitCode::kErrInsufficientFunds);
  EXPECT_EQ(apply<SubmitWithdrawal>(owners[0], multisig_address, {receiver, 0})
                .exit_code,
            VMExitCode::kErrIllegalArgument);

  const auto submitted{result<SubmitWithdrawal>(apply<SubmitWithdrawal>(
      owners[0], multisig_address, {receiver, 2000}))};
  const auto approved{approve(owners[2], submitted.tx_id)};
  EXPECT_TRUE(approved.applied);
  EXPECT_EQ(approved.code, VMExitCode::kOk);
  EXPECT_EQ(balance(receiver), 2000);
  EXPECT_EQ(balance(multisig_address), TokenAmount{treasury - 2000});
}

/**
 * @given Multisig
 * @when plain transfer is sent to it
 * @then accepted with Deposit event
 */
TEST_F(MultisigSystemTest, Deposit) {
  EXPECT_OUTCOME_TRUE(receipt,
                      env->applyMessage({multisig_address,
                                         outsider,
                                         25,
                                         kSendMethodNumber,
                                         {}}));
  EXPECT_EQ(receipt.exit_code, VMExitCode::kOk);
  ASSERT_EQ(eventNames(receipt), (std::vector<std::string>{"Deposit"}));
  EXPECT_OUTCOME_TRUE(deposit,
                      decodeActorEvent<DepositEvent>(receipt.events[0]));
  EXPECT_EQ(deposit.sender, outsider);
  EXPECT_EQ(deposit.value, 25);
  EXPECT_EQ(balance(multisig_address), TokenAmount{treasury + 25});
}

/// Owners and threshold are reported
TEST_F(MultisigSystemTest, GetOwners) {
  const auto result{call<GetOwners>(multisig_address, {})};
  EXPECT_EQ(result.signers, owners);
  EXPECT_EQ(result.threshold, size_t{2});
}
