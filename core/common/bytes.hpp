/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <gsl/span>
#include <vector>

namespace fibon {
  /// Owned bytes: encoded params, results, actor states and events
  using Bytes = std::vector<uint8_t>;

  /// View of bytes being read
  using BytesIn = gsl::span<const uint8_t>;

  inline Bytes copy(BytesIn from) {
    return Bytes(from.begin(), from.end());
  }

  inline void copy(Bytes &to, BytesIn from) {
    to.assign(from.begin(), from.end());
  }

  inline void append(Bytes &to, BytesIn from) {
    to.insert(to.end(), from.begin(), from.end());
  }
}  // namespace fibon
