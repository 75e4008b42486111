/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "codec/cbor/cbor_decode_stream.hpp"
#include "codec/cbor/cbor_encode_stream.hpp"

namespace fibon::codec::cbor {
  /// Runs stream operation, system_error raised by stream becomes error
  template <typename F>
  auto catchStreamError(const F &f) -> outcome::result<decltype(f())> {
    try {
      return f();
    } catch (const std::system_error &e) {
      return outcome::failure(e.code());
    }
  }

  /// Encodes value as one CBOR item
  template <typename T>
  outcome::result<Bytes> encode(const T &value) {
    return catchStreamError([&] {
      CborEncodeStream s;
      s << value;
      return s.data();
    });
  }

  /**
   * Decodes value from CBOR
   * @param input - exactly one CBOR item
   * @return value or CborDecodeError
   */
  template <typename T>
  outcome::result<T> decode(BytesIn input) {
    OUTCOME_TRY(decoded, catchStreamError([&] {
                  std::pair<T, bool> out{};
                  CborDecodeStream s{input};
                  s >> out.first;
                  out.second = s.empty();
                  return out;
                }));
    if (!decoded.second) {
      return outcome::failure(CborDecodeError::kTrailingBytes);
    }
    return std::move(decoded.first);
  }
}  // namespace fibon::codec::cbor
