/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include "common/bytes.hpp"

namespace fibon::common::span {
  /// Characters of string as bytes, no copy
  inline BytesIn cbytes(std::string_view str) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return {reinterpret_cast<const uint8_t *>(str.data()), str.size()};
  }

  /// Bytes as string characters, no copy
  inline std::string_view bytestr(BytesIn bytes) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return {reinterpret_cast<const char *>(bytes.data()),
            static_cast<size_t>(bytes.size())};
  }
}  // namespace fibon::common::span
