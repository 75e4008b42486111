/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "codec/cbor/streams_annotation.hpp"
#include "primitives/address/address_codec.hpp"
#include "vm/actor/actor.hpp"

namespace fibon::vm::message {
  using actor::MethodNumber;
  using actor::MethodParams;
  using primitives::TokenAmount;
  using primitives::address::Address;

  /**
   * @brief Call of actor method, applied by VM or sent between actors
   */
  struct UnsignedMessage {
    UnsignedMessage() = default;

    UnsignedMessage(Address to,
                    Address from,
                    TokenAmount value,
                    MethodNumber method,
                    MethodParams params)
        : to{to},
          from{from},
          value{std::move(value)},
          method{method},
          params{std::move(params)} {}

    Address to;
    Address from;
    TokenAmount value{};
    MethodNumber method{};
    MethodParams params;

    inline bool operator==(const UnsignedMessage &other) const {
      return to == other.to && from == other.from && value == other.value
             && method == other.method && params == other.params;
    }
  };
  CBOR_TUPLE(UnsignedMessage, to, from, value, method, params)
}  // namespace fibon::vm::message
