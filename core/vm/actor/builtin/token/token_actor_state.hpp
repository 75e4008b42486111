/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>

#include "codec/cbor/streams_annotation.hpp"
#include "common/outcome.hpp"
#include "primitives/address/address_codec.hpp"
#include "primitives/types.hpp"

namespace fibon::vm::actor::builtin::token {
  using primitives::TokenAmount;
  using primitives::address::Address;

  /**
   * Fungible token ledger
   */
  struct TokenActorState {
    /// Only owner may mint
    Address owner;
    TokenAmount total_supply{};
    /// Non-zero balances
    std::map<Address, TokenAmount> balances;
    /// Non-zero allowances by owner and spender
    std::map<Address, std::map<Address, TokenAmount>> allowances;

    TokenAmount balanceOf(const Address &address) const;

    TokenAmount allowance(const Address &holder, const Address &spender) const;

    void setBalance(const Address &address, const TokenAmount &balance);

    void setAllowance(const Address &holder,
                      const Address &spender,
                      const TokenAmount &amount);

    /// Moves tokens, fails with kErrInsufficientFunds
    outcome::result<void> transfer(const Address &from,
                                   const Address &to,
                                   const TokenAmount &amount);

    /// Spends allowance of spender, fails with kErrInsufficientFunds
    outcome::result<void> spendAllowance(const Address &holder,
                                         const Address &spender,
                                         const TokenAmount &amount);

    void mint(const Address &to, const TokenAmount &amount);

    outcome::result<void> burn(const Address &from, const TokenAmount &amount);
  };
  CBOR_TUPLE(TokenActorState, owner, total_supply, balances, allowances)

}  // namespace fibon::vm::actor::builtin::token
