/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include "primitives/address/address.hpp"
#include "primitives/big_int.hpp"

namespace fibon::primitives {
  using address::ActorId;

  using TokenAmount = BigInt;

  /// Seconds since unix epoch
  using UnixTime = int64_t;

  /// Seconds, difference between two UnixTime values
  using Duration = int64_t;

  using MethodNumber = uint64_t;
}  // namespace fibon::primitives

namespace fibon {
  using primitives::TokenAmount;
  using primitives::UnixTime;
}  // namespace fibon
