/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "primitives/big_int.hpp"

namespace fibon::common::math {
  using primitives::BigInt;

  /// Scale of fixed point values with 18 decimal digits
  static const BigInt kPrecision18{"1000000000000000000"};

  /// div with round-floor
  inline BigInt bigdiv(const BigInt &n, const BigInt &d) {
    if (!n.is_zero() && n.sign() != d.sign()) {
      return (n + 1) / d - 1;
    }
    return n / d;
  }

  /// mod with round-floor
  inline BigInt bigmod(const BigInt &n, const BigInt &d) {
    const auto r = bigdiv(n, d);
    return n - r * d;
  }

  /**
   * Converts ratio to fixed point Q.18 value
   * @param numerator - ratio numerator
   * @param denominator - ratio denominator, must be positive
   * @return floor(numerator * 1e18 / denominator)
   */
  inline BigInt toFixed18(const BigInt &numerator, const BigInt &denominator) {
    return bigdiv(numerator * kPrecision18, denominator);
  }

  /// Multiplies integer by fixed point Q.18 value, rounding floor
  inline BigInt mulFixed18(const BigInt &value, const BigInt &fixed) {
    return bigdiv(value * fixed, kPrecision18);
  }
}  // namespace fibon::common::math

namespace fibon {
  using common::math::bigdiv;
  using common::math::bigmod;
}  // namespace fibon
