/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>

#include "clock/impl/manual_clock.hpp"
#include "node/main/config.hpp"
#include "vm/runtime/env.hpp"

namespace fibon::node {
  using primitives::address::Address;
  using vm::runtime::Env;

  enum class GenesisError {
    kMessageFailed = 1,
    kTransactionNotExecuted,
  };

  /// Suite deployed at genesis
  struct Genesis {
    std::shared_ptr<Env> env;
    std::shared_ptr<clock::ManualClock> clock;
    UnixTime genesis_time{};
    /// Owner and beneficiary accounts by name
    std::map<std::string, Address> accounts;
    Address multisig;
    Address token;
    Address vesting;
  };

  /**
   * Deploys multisig, token and vesting owned by multisig. Privileged steps
   * are submitted by first owner and approved by next owners up to threshold.
   */
  outcome::result<Genesis> buildGenesis(const Config &config);

  /**
   * Applies message and decodes its return value
   * @return decoded value, GenesisError::kMessageFailed if exit code is not
   * kOk
   */
  template <typename M>
  outcome::result<typename M::Result> applyMethod(
      Env &env,
      const Address &from,
      const Address &to,
      const typename M::Params &params,
      const TokenAmount &value = 0);

  /// Calls read-only method without changing state
  template <typename M>
  outcome::result<typename M::Result> callMethod(
      Env &env,
      const Address &from,
      const Address &to,
      const typename M::Params &params);
}  // namespace fibon::node

OUTCOME_HPP_DECLARE_ERROR(fibon::node, GenesisError);

namespace fibon::node {
  namespace detail {
    template <typename M>
    outcome::result<typename M::Result> decodeReceipt(
        const vm::runtime::MessageReceipt &receipt) {
      if (receipt.exit_code != vm::VMExitCode::kOk) {
        return outcome::failure(GenesisError::kMessageFailed);
      }
      return vm::actor::decodeActorReturn<typename M::Result>(
          receipt.return_value);
    }
  }  // namespace detail

  template <typename M>
  outcome::result<typename M::Result> applyMethod(
      Env &env,
      const Address &from,
      const Address &to,
      const typename M::Params &params,
      const TokenAmount &value) {
    OUTCOME_TRY(encoded, vm::actor::encodeActorParams(params));
    OUTCOME_TRY(receipt,
                env.applyMessage({to, from, value, M::Number, encoded}));
    return detail::decodeReceipt<M>(receipt);
  }

  template <typename M>
  outcome::result<typename M::Result> callMethod(
      Env &env,
      const Address &from,
      const Address &to,
      const typename M::Params &params) {
    OUTCOME_TRY(encoded, vm::actor::encodeActorParams(params));
    OUTCOME_TRY(receipt, env.call({to, from, 0, M::Number, encoded}));
    return detail::decodeReceipt<M>(receipt);
  }
}  // namespace fibon::node
