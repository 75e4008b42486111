/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "clock/impl/manual_clock.hpp"

#include <algorithm>

#include "common/error_text.hpp"

namespace fibon::clock {
  ManualClock::ManualClock(UnixTime start) : now_{start} {}

  UnixTime ManualClock::now() const {
    return now_;
  }

  outcome::result<void> ManualClock::setTime(UnixTime time) {
    if (time < now_) {
      return ERROR_TEXT("ManualClock: time must not go backward");
    }
    now_ = time;
    return outcome::success();
  }

  void ManualClock::advance(UnixTime delta) {
    now_ += std::max(delta, UnixTime::zero());
  }
}  // namespace fibon::clock
