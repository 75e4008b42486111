/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/bytes.hpp"
#include "primitives/address/address.hpp"
#include "primitives/big_int.hpp"
#include "primitives/types.hpp"
#include "vm/actor/code.hpp"

namespace fibon::vm::actor {
  using primitives::BigInt;
  using primitives::TokenAmount;
  using primitives::address::Address;

  /**
   * Consider MethodNum numbers to be similar in concerns as for offsets in
   * function tables (in programming languages), and for tags in ProtocolBuffer
   * fields. A method number is never reused for another method.
   */
  using MethodNumber = primitives::MethodNumber;

  /// CBOR encoded method params
  using MethodParams = Bytes;

  using CodeId = ActorCodeCid;

  /**
   * Common actor state interface represents the storage all actors keep
   */
  struct Actor {
    /// Identifies the code this actor executes
    CodeId code{};
    /// CBOR encoded actor-specific state, empty before construction
    Bytes head{};
    /// Balance of native currency held by this actor
    TokenAmount balance{};
  };

  inline bool operator==(const Actor &lhs, const Actor &rhs) {
    return lhs.code == rhs.code && lhs.head == rhs.head
           && lhs.balance == rhs.balance;
  }

  /** Reserved method number for send operation */
  constexpr MethodNumber kSendMethodNumber{0};

  /** Reserved method number for constructor */
  constexpr MethodNumber kConstructorMethodNumber{1};

  inline static const auto kSystemActorAddress = Address::makeFromId(0);

  /// Ids below are reserved for singleton actors
  constexpr primitives::ActorId kFirstNonSingletonActorId{100};
}  // namespace fibon::vm::actor
