/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <string>

#include "common/outcome.hpp"

namespace fibon::clock {
  /// Seconds since unix epoch
  using UnixTime = std::chrono::seconds;

  enum class TimeFromStringError { kInvalidFormat = 1 };

  /// ISO-8601 UTC time with second precision, "2020-01-01T00:00:00Z"
  std::string unixTimeToString(UnixTime time);

  /// Parses string of unixTimeToString format
  outcome::result<UnixTime> unixTimeFromString(const std::string &str);
}  // namespace fibon::clock

OUTCOME_HPP_DECLARE_ERROR(fibon::clock, TimeFromStringError);
