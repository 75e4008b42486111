/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/multiprecision/cpp_int.hpp>

#include "codec/cbor/streams_annotation.hpp"
#include "common/bytes.hpp"

namespace fibon::primitives {
  /// Arbitrary precision signed integer of token amounts and fixed point math
  using BigInt = boost::multiprecision::cpp_int;

  constexpr uint8_t kBigIntPositive{0};
  constexpr uint8_t kBigIntNegative{1};

  /// Sign byte followed by big-endian magnitude, zero is empty
  inline Bytes bigIntToBytes(const BigInt &value) {
    Bytes bytes;
    if (value.is_zero()) {
      return bytes;
    }
    bytes.push_back(value.sign() < 0 ? kBigIntNegative : kBigIntPositive);
    const BigInt magnitude{abs(value)};
    export_bits(magnitude, std::back_inserter(bytes), 8);
    return bytes;
  }

  inline BigInt bigIntFromBytes(BytesIn bytes) {
    BigInt value;
    if (bytes.empty()) {
      return value;
    }
    import_bits(value, bytes.begin() + 1, bytes.end());
    if (bytes[0] == kBigIntNegative) {
      value = -value;
    }
    return value;
  }
}  // namespace fibon::primitives

namespace boost::multiprecision {
  CBOR_ENCODE(cpp_int, value) {
    return s << fibon::primitives::bigIntToBytes(value);
  }

  CBOR_DECODE(cpp_int, value) {
    fibon::Bytes bytes;
    s >> bytes;
    value = fibon::primitives::bigIntFromBytes(bytes);
    return s;
  }
}  // namespace boost::multiprecision
