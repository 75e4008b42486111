/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include "common/outcome.hpp"

namespace fibon::primitives::address {
  using ActorId = uint64_t;

  /**
   * @brief Potential errors creating and handling addresses
   */
  enum class AddressError {
    kInvalidPrefix = 1, /**< Textual form does not start with 'a' */
    kInvalidPayload,    /**< Id is not a decimal number or out of range */
  };

  /// Prefix of textual form
  constexpr char kAddressPrefix{'a'};

  /**
   * @brief Address refers to an actor in the state tree
   */
  struct Address {
    Address() = default;
    explicit Address(ActorId id) : id{id} {}

    /// id - number assigned to actor at creation
    static Address makeFromId(ActorId id);

    ActorId getId() const;

    ActorId id{};
  };

  /**
   * @brief Addresses equality operator
   */
  bool operator==(const Address &lhs, const Address &rhs);

  /**
   * @brief Addresses not equality operator
   */
  bool operator!=(const Address &lhs, const Address &rhs);

  /**
   * @brief Addresses "less than" operator
   */
  bool operator<(const Address &lhs, const Address &rhs);
}  // namespace fibon::primitives::address

namespace fibon::primitives {
  using address::Address;
}  // namespace fibon::primitives

/**
 * @brief Outcome errors declaration
 */
OUTCOME_HPP_DECLARE_ERROR(fibon::primitives::address, AddressError);
