/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/address/address.hpp"

namespace fibon::primitives::address {
  Address Address::makeFromId(ActorId id) {
    return Address{id};
  }

  ActorId Address::getId() const {
    return id;
  }

  bool operator==(const Address &lhs, const Address &rhs) {
    return lhs.id == rhs.id;
  }

  bool operator!=(const Address &lhs, const Address &rhs) {
    return !(lhs == rhs);
  }

  bool operator<(const Address &lhs, const Address &rhs) {
    return lhs.id < rhs.id;
  }
}  // namespace fibon::primitives::address

OUTCOME_CPP_DEFINE_CATEGORY(fibon::primitives::address, AddressError, e) {
  using fibon::primitives::address::AddressError;
  switch (e) {
    case AddressError::kInvalidPrefix:
      return "AddressError: address must start with 'a'";
    case AddressError::kInvalidPayload:
      return "AddressError: invalid actor id";
    default:
      return "AddressError: unknown error";
  }
}
