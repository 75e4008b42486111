/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/clock.hpp"

namespace fibon::clock {
  /**
   * Clock driven by caller, used to replay schedules at chosen moments.
   * Time never goes backward.
   */
  class ManualClock : public Clock {
   public:
    explicit ManualClock(UnixTime start);

    UnixTime now() const override;

    /// Fails if time is earlier than current time
    outcome::result<void> setTime(UnixTime time);

    /// Negative delta is ignored
    void advance(UnixTime delta);

   private:
    UnixTime now_;
  };
}  // namespace fibon::clock
