/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <tuple>

#include "vm/actor/builtin/multisig/multisig_actor_state.hpp"
#include "vm/runtime/runtime.hpp"

namespace fibon::vm::actor::builtin::multisig {
  using runtime::Runtime;

  /// Forward attempted flag, return value and exit code of forwarded call
  using ApproveTransactionResult = std::tuple<bool, Bytes, VMExitCode>;

  /// Transaction approval and execution on runtime of current invocation
  class MultisigUtils {
   public:
    explicit MultisigUtils(Runtime &runtime) : runtime_{runtime} {}

    /**
     * Check that caller is a signer
     * @param state - actor state
     */
    outcome::result<void> assertCallerIsSigner(
        const MultisigActorState &state) const;

    /**
     * Approve transaction on behalf of caller and execute it if approval
     * count reaches threshold exactly.
     * @param tx_id - transaction id
     * @param transaction - transaction to approve
     * @return attempted flag, result of sending a message and result code of
     * sending a message
     */
    outcome::result<ApproveTransactionResult> approveTransaction(
        const TransactionId &tx_id, Transaction &transaction) const;

    /**
     * Forward transaction call. Failure of forwarded call is reported with
     * ExecutionFailure event and exit code, transaction stays not executed.
     * @param tx_id - transaction id
     * @param transaction - approved transaction
     * @return attempted flag, result of sending a message and result code of
     * sending a message
     */
    outcome::result<ApproveTransactionResult> executeTransaction(
        const TransactionId &tx_id, const Transaction &transaction) const;

   private:
    outcome::result<void> setExecuted(const TransactionId &tx_id,
                                      bool executed) const;

    Runtime &runtime_;
  };

}  // namespace fibon::vm::actor::builtin::multisig
