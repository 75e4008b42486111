/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "clock/impl/system_clock.hpp"

namespace fibon::clock {
  UnixTime SystemClock::now() const {
    return std::chrono::time_point_cast<UnixTime>(
               std::chrono::system_clock::now())
        .time_since_epoch();
  }
}  // namespace fibon::clock
