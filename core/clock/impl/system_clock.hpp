/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/clock.hpp"

namespace fibon::clock {
  /// Wall clock of the host, truncated to seconds
  class SystemClock : public Clock {
   public:
    UnixTime now() const override;
  };
}  // namespace fibon::clock
