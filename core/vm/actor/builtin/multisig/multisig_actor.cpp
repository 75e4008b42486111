/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "vm/actor/builtin/multisig/multisig_actor.hpp"

#include "common/logger.hpp"
#include "vm/actor/builtin/multisig/multisig_actor_utils.hpp"
#include "vm/actor/builtin/multisig/multisig_events.hpp"

namespace fibon::vm::actor::builtin::multisig {

  namespace {
    common::Logger logger() {
      static common::Logger logger{common::createLogger("multisig")};
      return logger;
    }
  }  // namespace

  // Deposit
  //============================================================================

  ACTOR_METHOD_IMPL(Deposit) {
    const auto &value{runtime.getValueReceived()};
    OUTCOME_TRY(
        runtime.emitEventM(DepositEvent{runtime.getImmediateCaller(), value}));
    logger()->info("deposit of {} from {} to {}",
                   value.str(),
                   runtime.getImmediateCaller(),
                   runtime.getCurrentReceiver());
    return outcome::success();
  }

  // Construct
  //============================================================================

  outcome::result<void> Construct::checkParams(
      const std::vector<Address> &signers, size_t threshold) {
    VALIDATE_ARG(threshold <= signers.size());
    VALIDATE_ARG(threshold >= 1);
    return outcome::success();
  }

  ACTOR_METHOD_IMPL(Construct) {
    OUTCOME_TRY(runtime.validateImmediateCallerIs(kSystemActorAddress));
    VALIDATE_ARG(!params.signers.empty());
    OUTCOME_TRY(checkParams(params.signers, params.threshold));

    MultisigActorState state;
    for (const auto &signer : params.signers) {
      VALIDATE_ARG(state.signers.insert(signer).second);
    }
    state.threshold = params.threshold;
    OUTCOME_TRY(runtime.commitState(state));
    return outcome::success();
  }

  // Submit
  //============================================================================

  outcome::result<Submit::Result> Submit::submit(Runtime &runtime,
                                                 Transaction transaction) {
    OUTCOME_TRY(state, runtime.getActorState<MultisigActorState>());

    const MultisigUtils utils{runtime};
    const auto tx_id = state.next_transaction_id;
    state.next_transaction_id++;
    state.transactions[tx_id] = transaction;
    OUTCOME_TRY(runtime.commitState(state));
    OUTCOME_TRY(runtime.emitEventM(SubmissionEvent{tx_id}));

    OUTCOME_TRY(approve, utils.approveTransaction(tx_id, transaction));
    const auto &[applied, return_value, code] = approve;

    return Result{tx_id, applied, code, return_value};
  }

  outcome::result<void> Submit::assertCallerIsSigner(Runtime &runtime) {
    OUTCOME_TRY(state, runtime.getActorState<MultisigActorState>());
    OUTCOME_TRY(MultisigUtils{runtime}.assertCallerIsSigner(state));
    return outcome::success();
  }

  ACTOR_METHOD_IMPL(Submit) {
    OUTCOME_TRY(assertCallerIsSigner(runtime));
    VALIDATE_ARG(params.value >= 0);
    VALIDATE_ARG(runtime.getValueReceived() == params.value);
    return submit(
        runtime,
        Transaction{params.to, params.value, params.method, params.params});
  }

  // SubmitWithdrawal
  //============================================================================

  ACTOR_METHOD_IMPL(SubmitWithdrawal) {
    OUTCOME_TRY(Submit::assertCallerIsSigner(runtime));
    VALIDATE_ARG(runtime.getValueReceived() == 0);
    VALIDATE_ARG(params.amount > 0);
    REQUIRE_NO_ERROR_A(
        balance, runtime.getCurrentBalance(), VMExitCode::kErrIllegalState);
    REQUIRE_FUNDS(balance >= params.amount);
    return Submit::submit(
        runtime,
        Transaction{params.to, params.amount, kSendMethodNumber, {}});
  }

  // Approve
  //============================================================================

  ACTOR_METHOD_IMPL(Approve) {
    OUTCOME_TRY(state, runtime.getActorState<MultisigActorState>());

    const MultisigUtils utils{runtime};
    OUTCOME_TRY(utils.assertCallerIsSigner(state));

    REQUIRE_NO_ERROR_A(transaction,
                       state.getTransaction(params.tx_id),
                       VMExitCode::kErrNotFound);
    REQUIRE_STATE(!transaction.executed);

    OUTCOME_TRY(approve, utils.approveTransaction(params.tx_id, transaction));
    const auto &[applied, return_value, code] = approve;

    return Result{applied, code, return_value};
  }

  // Execute
  //============================================================================

  ACTOR_METHOD_IMPL(Execute) {
    OUTCOME_TRY(state, runtime.getActorState<MultisigActorState>());

    REQUIRE_NO_ERROR_A(transaction,
                       state.getTransaction(params.tx_id),
                       VMExitCode::kErrNotFound);
    REQUIRE_STATE(!transaction.executed);
    if (transaction.approved.size() < state.threshold) {
      ABORT(VMExitCode::kErrForbidden);
    }

    const MultisigUtils utils{runtime};
    OUTCOME_TRY(execute, utils.executeTransaction(params.tx_id, transaction));
    const auto &[applied, return_value, code] = execute;

    return Result{applied, code, return_value};
  }

  // Read-only
  //============================================================================

  ACTOR_METHOD_IMPL(GetTransaction) {
    OUTCOME_TRY(state, runtime.getActorState<MultisigActorState>());
    REQUIRE_NO_ERROR_A(transaction,
                       state.getTransaction(params.tx_id),
                       VMExitCode::kErrNotFound);
    return std::move(transaction);
  }

  ACTOR_METHOD_IMPL(IsApproved) {
    OUTCOME_TRY(state, runtime.getActorState<MultisigActorState>());
    REQUIRE_NO_ERROR_A(transaction,
                       state.getTransaction(params.tx_id),
                       VMExitCode::kErrNotFound);
    return transaction.approved.count(params.owner) != 0;
  }

  ACTOR_METHOD_IMPL(GetOwners) {
    OUTCOME_TRY(state, runtime.getActorState<MultisigActorState>());
    return Result{{state.signers.begin(), state.signers.end()},
                  state.threshold};
  }

  ACTOR_METHOD_IMPL(GetTransactionCount) {
    OUTCOME_TRY(state, runtime.getActorState<MultisigActorState>());
    uint64_t count{};
    for (const auto &[tx_id, transaction] : state.transactions) {
      if ((params.pending && !transaction.executed)
          || (params.executed && transaction.executed)) {
        ++count;
      }
    }
    return count;
  }

  //============================================================================

  const ActorExports exports{
      exportMethod<Deposit>(),
      exportMethod<Construct>(),
      exportMethod<Submit>(),
      exportMethod<SubmitWithdrawal>(),
      exportMethod<Approve>(),
      exportMethod<Execute>(),
      exportMethod<GetTransaction>(),
      exportMethod<IsApproved>(),
      exportMethod<GetOwners>(),
      exportMethod<GetTransactionCount>(),
  };
}  // namespace fibon::vm::actor::builtin::multisig
