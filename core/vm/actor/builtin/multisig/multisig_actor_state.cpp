/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "vm/actor/builtin/multisig/multisig_actor_state.hpp"

#include "vm/exit_code/exit_code.hpp"

namespace fibon::vm::actor::builtin::multisig {

  outcome::result<Transaction> MultisigActorState::getTransaction(
      const TransactionId &tx_id) const {
    const auto it{transactions.find(tx_id)};
    if (it == transactions.end()) {
      return VMExitCode::kErrNotFound;
    }
    return it->second;
  }

}  // namespace fibon::vm::actor::builtin::multisig
