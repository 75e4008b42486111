/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <set>

#include "common/outcome.hpp"
#include "primitives/address/address.hpp"
#include "vm/actor/builtin/multisig/transaction.hpp"

namespace fibon::vm::actor::builtin::multisig {

  /**
   * State of Multisig Actor instance
   */
  struct MultisigActorState {
    std::set<Address> signers;
    size_t threshold{0};
    TransactionId next_transaction_id{0};

    /// All transactions by id
    std::map<TransactionId, Transaction> transactions;

    /**
     * Check if address is signer
     * @param address - address to check
     * @return true if address is signer
     */
    inline bool isSigner(const Address &address) const {
      return signers.count(address) != 0;
    }

    /**
     * Get transaction
     * @param tx_id - transaction id
     * @return transaction or kErrNotFound
     */
    outcome::result<Transaction> getTransaction(
        const TransactionId &tx_id) const;
  };
  CBOR_TUPLE(MultisigActorState,
             signers,
             threshold,
             next_transaction_id,
             transactions)

}  // namespace fibon::vm::actor::builtin::multisig
