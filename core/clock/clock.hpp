/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/time.hpp"

namespace fibon::clock {
  /// Source of UTC time with second precision
  class Clock {
   public:
    virtual ~Clock() = default;

    virtual UnixTime now() const = 0;
  };
}  // namespace fibon::clock
