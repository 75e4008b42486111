/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

namespace fibon {
  /// Identifies the code an actor executes
  struct ActorCodeCid : std::string_view {};
  constexpr bool operator==(const ActorCodeCid &l, const ActorCodeCid &r) {
    return static_cast<const std::string_view &>(l)
           == static_cast<const std::string_view &>(r);
  }
  constexpr bool operator!=(const ActorCodeCid &l, const ActorCodeCid &r) {
    return !(l == r);
  }
  constexpr bool operator<(const ActorCodeCid &l, const ActorCodeCid &r) {
    return static_cast<const std::string_view &>(l)
           < static_cast<const std::string_view &>(r);
  }
}  // namespace fibon
