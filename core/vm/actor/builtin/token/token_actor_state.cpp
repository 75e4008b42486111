/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "vm/actor/builtin/token/token_actor_state.hpp"

#include "vm/exit_code/exit_code.hpp"

namespace fibon::vm::actor::builtin::token {

  TokenAmount TokenActorState::balanceOf(const Address &address) const {
    const auto it{balances.find(address)};
    return it == balances.end() ? TokenAmount{0} : it->second;
  }

  TokenAmount TokenActorState::allowance(const Address &holder,
                                         const Address &spender) const {
    const auto it{allowances.find(holder)};
    if (it == allowances.end()) {
      return 0;
    }
    const auto it2{it->second.find(spender)};
    return it2 == it->second.end() ? TokenAmount{0} : it2->second;
  }

  void TokenActorState::setBalance(const Address &address,
                                   const TokenAmount &balance) {
    if (balance == 0) {
      balances.erase(address);
    } else {
      balances[address] = balance;
    }
  }

  void TokenActorState::setAllowance(const Address &holder,
                                     const Address &spender,
                                     const TokenAmount &amount) {
    if (amount == 0) {
      auto it{allowances.find(holder)};
      if (it != allowances.end()) {
        it->second.erase(spender);
        if (it->second.empty()) {
          allowances.erase(it);
        }
      }
    } else {
      allowances[holder][spender] = amount;
    }
  }

  outcome::result<void> TokenActorState::transfer(const Address &from,
                                                  const Address &to,
                                                  const TokenAmount &amount) {
    const auto from_balance{balanceOf(from)};
    if (from_balance < amount) {
      return VMExitCode::kErrInsufficientFunds;
    }
    setBalance(from, from_balance - amount);
    setBalance(to, balanceOf(to) + amount);
    return outcome::success();
  }

  outcome::result<void> TokenActorState::spendAllowance(
      const Address &holder,
      const Address &spender,
      const TokenAmount &amount) {
    const auto allowed{allowance(holder, spender)};
    if (allowed < amount) {
      return VMExitCode::kErrInsufficientFunds;
    }
    setAllowance(holder, spender, allowed - amount);
    return outcome::success();
  }

  void TokenActorState::mint(const Address &to, const TokenAmount &amount) {
    setBalance(to, balanceOf(to) + amount);
    total_supply += amount;
  }

  outcome::result<void> TokenActorState::burn(const Address &from,
                                              const TokenAmount &amount) {
    const auto from_balance{balanceOf(from)};
    if (from_balance < amount) {
      return VMExitCode::kErrInsufficientFunds;
    }
    setBalance(from, from_balance - amount);
    total_supply -= amount;
    return outcome::success();
  }

}  // namespace fibon::vm::actor::builtin::token
