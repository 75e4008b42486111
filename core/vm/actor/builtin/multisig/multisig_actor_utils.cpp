/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "vm/actor/builtin/multisig/multisig_actor_utils.hpp"

#include "common/logger.hpp"
#include "vm/actor/builtin/multisig/multisig_events.hpp"

namespace fibon::vm::actor::builtin::multisig {

  outcome::result<void> MultisigUtils::assertCallerIsSigner(
      const MultisigActorState &state) const {
    return requireCondition(state.isSigner(runtime_.getImmediateCaller()),
                            VMExitCode::kErrForbidden);
  }

  outcome::result<ApproveTransactionResult> MultisigUtils::approveTransaction(
      const TransactionId &tx_id, Transaction &transaction) const {
    const Address caller = runtime_.getImmediateCaller();
    if (!transaction.approved.insert(caller).second) {
      ABORT(VMExitCode::kErrForbidden);
    }

    OUTCOME_TRY(state, runtime_.getActorState<MultisigActorState>());
    state.transactions[tx_id] = transaction;
    OUTCOME_TRY(runtime_.commitState(state));
    OUTCOME_TRY(runtime_.emitEventM(ConfirmationEvent{caller, tx_id}));

    if (transaction.approved.size() == state.threshold) {
      return executeTransaction(tx_id, transaction);
    }
    return std::make_tuple(false, Bytes{}, VMExitCode::kOk);
  }

  outcome::result<ApproveTransactionResult> MultisigUtils::executeTransaction(
      const TransactionId &tx_id, const Transaction &transaction) const {
    // marked before forwarding so reentrant call cannot execute it again
    OUTCOME_TRY(setExecuted(tx_id, true));

    const auto send_result = runtime_.send(transaction.to,
                                               transaction.method,
                                               transaction.params,
                                               transaction.value);
    OUTCOME_TRY(code, asExitCode(send_result));
    Bytes out;
    if (send_result) {
      out = send_result.value();
      OUTCOME_TRY(runtime_.emitEventM(ExecutionEvent{tx_id}));
    } else {
      common::createLogger("multisig")
          ->warn("transaction {} of {} failed with exit code {}",
                 tx_id,
                 runtime_.getCurrentReceiver(),
                 static_cast<int64_t>(code));
      OUTCOME_TRY(setExecuted(tx_id, false));
      OUTCOME_TRY(
          runtime_.emitEventM(ExecutionFailureEvent{tx_id, code}));
    }
    return std::make_tuple(true, out, code);
  }

  outcome::result<void> MultisigUtils::setExecuted(const TransactionId &tx_id,
                                                   bool executed) const {
    OUTCOME_TRY(state, runtime_.getActorState<MultisigActorState>());
    auto it{state.transactions.find(tx_id)};
    VM_ASSERT(it != state.transactions.end());
    it->second.executed = executed;
    OUTCOME_TRY(runtime_.commitState(state));
    return outcome::success();
  }

}  // namespace fibon::vm::actor::builtin::multisig
