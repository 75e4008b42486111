/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include "vm/actor/actor_method.hpp"
#include "vm/actor/builtin/token/token_actor_state.hpp"

namespace fibon::vm::actor::builtin::token {

  struct Construct : ActorMethodBase<1> {
    struct Params {
      Address owner;
    };

    ACTOR_METHOD_DECL();
  };
  CBOR_TUPLE(Construct::Params, owner)

  struct Mint : ActorMethodBase<2> {
    struct Params {
      Address to;
      TokenAmount amount;
    };

    ACTOR_METHOD_DECL();
  };
  CBOR_TUPLE(Mint::Params, to, amount)

  struct Transfer : ActorMethodBase<3> {
    struct Params {
      Address to;
      TokenAmount amount;
    };

    ACTOR_METHOD_DECL();
  };
  CBOR_TUPLE(Transfer::Params, to, amount)

  struct BalanceOf : ActorMethodBase<4> {
    struct Params {
      Address address;
    };
    using Result = TokenAmount;

    ACTOR_METHOD_DECL();
  };
  CBOR_TUPLE(BalanceOf::Params, address)

  /// Sets allowance of spender over caller tokens
  struct Approve : ActorMethodBase<5> {
    struct Params {
      Address spender;
      TokenAmount amount;
    };

    ACTOR_METHOD_DECL();
  };
  CBOR_TUPLE(Approve::Params, spender, amount)

  struct TransferFrom : ActorMethodBase<6> {
    struct Params {
      Address from;
      Address to;
      TokenAmount amount;
    };

    ACTOR_METHOD_DECL();
  };
  CBOR_TUPLE(TransferFrom::Params, from, to, amount)

  /// Burns tokens of holder using caller allowance
  struct BurnFrom : ActorMethodBase<7> {
    struct Params {
      Address from;
      TokenAmount amount;
    };

    ACTOR_METHOD_DECL();
  };
  CBOR_TUPLE(BurnFrom::Params, from, amount)

  struct TotalSupply : ActorMethodBase<8> {
    using Result = TokenAmount;

    ACTOR_METHOD_DECL();
  };

  struct Allowance : ActorMethodBase<9> {
    struct Params {
      Address owner;
      Address spender;
    };
    using Result = TokenAmount;

    ACTOR_METHOD_DECL();
  };
  CBOR_TUPLE(Allowance::Params, owner, spender)

  /// Tokens moved, no sender on mint and no receiver on burn
  struct TransferEvent {
    static constexpr std::string_view kName{"Transfer"};
    boost::optional<Address> from;
    boost::optional<Address> to;
    TokenAmount amount;
  };
  CBOR_TUPLE(TransferEvent, from, to, amount)

  struct ApprovalEvent {
    static constexpr std::string_view kName{"Approval"};
    Address owner;
    Address spender;
    TokenAmount amount;
  };
  CBOR_TUPLE(ApprovalEvent, owner, spender, amount)

  /** Exported Token Actor methods to invoker */
  extern const ActorExports exports;

}  // namespace fibon::vm::actor::builtin::token
