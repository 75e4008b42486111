/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "vm/actor/actor_method.hpp"
#include "vm/actor/builtin/multisig/multisig_actor_state.hpp"

namespace fibon::vm::actor::builtin::multisig {
  using primitives::BigInt;
  using primitives::TokenAmount;
  using primitives::address::Address;

  /// Plain transfer, records deposit
  struct Deposit : ActorMethodBase<0> {
    ACTOR_METHOD_DECL();
  };

  struct Construct : ActorMethodBase<1> {
    struct Params {
      std::vector<Address> signers;
      size_t threshold{};
    };

    ACTOR_METHOD_DECL();

    static outcome::result<void> checkParams(
        const std::vector<Address> &signers, size_t threshold);
  };
  CBOR_TUPLE(Construct::Params, signers, threshold)

  struct Submit : ActorMethodBase<2> {
    struct Params {
      Address to;
      TokenAmount value;
      MethodNumber method{};
      MethodParams params;
    };
    struct Result {
      TransactionId tx_id{};
      bool applied{false};
      VMExitCode code{};
      Bytes return_value;

      inline bool operator==(const Result &rhs) const {
        return tx_id == rhs.tx_id && applied == rhs.applied && code == rhs.code
               && return_value == rhs.return_value;
      }
    };

    ACTOR_METHOD_DECL();

    static outcome::result<void> assertCallerIsSigner(Runtime &runtime);

    /// Stores new transaction and approves it on behalf of caller
    static outcome::result<Result> submit(Runtime &runtime,
                                          Transaction transaction);
  };
  CBOR_TUPLE(Submit::Params, to, value, method, params)
  CBOR_TUPLE(Submit::Result, tx_id, applied, code, return_value)

  /// Transfer of wallet funds without call payload
  struct SubmitWithdrawal : ActorMethodBase<3> {
    struct Params {
      Address to;
      TokenAmount amount;
    };
    using Result = Submit::Result;

    ACTOR_METHOD_DECL();
  };
  CBOR_TUPLE(SubmitWithdrawal::Params, to, amount)

  struct Approve : ActorMethodBase<4> {
    struct Params {
      TransactionId tx_id{};
    };
    struct Result {
      bool applied{false};
      VMExitCode code{};
      Bytes return_value;

      inline bool operator==(const Result &rhs) const {
        return applied == rhs.applied && code == rhs.code
               && return_value == rhs.return_value;
      }
    };

    ACTOR_METHOD_DECL();
  };
  CBOR_TUPLE(Approve::Params, tx_id)
  CBOR_TUPLE(Approve::Result, applied, code, return_value)

  /// Retries forwarding of approved transaction, callable by anyone
  struct Execute : ActorMethodBase<5> {
    using Params = Approve::Params;
    using Result = Approve::Result;

    ACTOR_METHOD_DECL();
  };

  struct GetTransaction : ActorMethodBase<6> {
    using Params = Approve::Params;
    using Result = Transaction;

    ACTOR_METHOD_DECL();
  };

  struct IsApproved : ActorMethodBase<7> {
    struct Params {
      TransactionId tx_id{};
      Address owner;
    };
    using Result = bool;

    ACTOR_METHOD_DECL();
  };
  CBOR_TUPLE(IsApproved::Params, tx_id, owner)

  struct GetOwners : ActorMethodBase<8> {
    struct Result {
      std::vector<Address> signers;
      size_t threshold{};
    };

    ACTOR_METHOD_DECL();
  };
  CBOR_TUPLE(GetOwners::Result, signers, threshold)

  /// Number of transactions, optionally filtered by status
  struct GetTransactionCount : ActorMethodBase<9> {
    struct Params {
      bool pending{true};
      bool executed{true};
    };
    using Result = uint64_t;

    ACTOR_METHOD_DECL();
  };
  CBOR_TUPLE(GetTransactionCount::Params, pending, executed)

  /** Exported Multisig Actor methods to invoker */
  extern const ActorExports exports;

}  // namespace fibon::vm::actor::builtin::multisig
