/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <set>

#include "codec/cbor/streams_annotation.hpp"
#include "primitives/address/address_codec.hpp"
#include "primitives/types.hpp"
#include "vm/actor/actor.hpp"

namespace fibon::vm::actor::builtin::multisig {
  using primitives::TokenAmount;
  using primitives::address::Address;

  using TransactionId = int64_t;

  /**
   * Multisignature transaction, never deleted
   */
  struct Transaction {
    Address to;
    TokenAmount value{};
    MethodNumber method{};
    MethodParams params;
    /// Set once forwarded call succeeds
    bool executed{false};

    /// Owners approved transaction, the size is the approval count
    std::set<Address> approved;

    inline bool operator==(const Transaction &other) const {
      return to == other.to && value == other.value && method == other.method
             && params == other.params && executed == other.executed
             && approved == other.approved;
    }
  };
  CBOR_TUPLE(Transaction, to, value, method, params, executed, approved)
}  // namespace fibon::vm::actor::builtin::multisig
