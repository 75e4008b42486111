/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <ostream>
#include <string>

#include <spdlog/fmt/fmt.h>

#include "codec/cbor/streams_annotation.hpp"
#include "primitives/address/address.hpp"

namespace fibon::primitives::address {
  /**
   * @brief Encodes an Address to a string, "a<id>"
   */
  std::string encodeToString(const Address &address);

  /**
   * @brief Decodes an Address from a string
   */
  outcome::result<Address> decodeFromString(const std::string &s);

  CBOR_ENCODE(Address, address) {
    return s << address.id;
  }

  CBOR_DECODE(Address, address) {
    return s >> address.id;
  }

  inline std::ostream &operator<<(std::ostream &os, const Address &address) {
    return os << encodeToString(address);
  }
}  // namespace fibon::primitives::address

template <>
struct fmt::formatter<fibon::primitives::address::Address>
    : formatter<std::string_view> {
  template <typename C>
  auto format(const fibon::primitives::address::Address &address,
              C &ctx) const {
    auto str = fibon::primitives::address::encodeToString(address);
    return formatter<std::string_view>::format(str, ctx);
  }
};
