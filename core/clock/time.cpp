/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "clock/time.hpp"

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/optional.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(fibon::clock, TimeFromStringError, e) {
  return "TimeFromStringError: expected YYYY-MM-DDTHH:MM:SSZ";
}

namespace fibon::clock {
  namespace pt = boost::posix_time;

  namespace {
    constexpr size_t kIsoLength{20};
    constexpr char kUtcSuffix{'Z'};

    const pt::ptime &epoch() {
      static const pt::ptime epoch{boost::gregorian::date{1970, 1, 1}};
      return epoch;
    }

    boost::optional<pt::ptime> parsePtime(const std::string &str) {
      pt::ptime ptime;
      try {
        ptime = pt::from_iso_extended_string(str);
      } catch (const boost::bad_lexical_cast &) {
        return boost::none;
      } catch (const std::out_of_range &) {
        // day, month or year out of range
        return boost::none;
      }
      if (ptime.is_special()) {
        return boost::none;
      }
      return ptime;
    }
  }  // namespace

  std::string unixTimeToString(UnixTime time) {
    const auto ptime{epoch() + pt::seconds{time.count()}};
    return pt::to_iso_extended_string(ptime) + kUtcSuffix;
  }

  outcome::result<UnixTime> unixTimeFromString(const std::string &str) {
    if (str.size() != kIsoLength || str.back() != kUtcSuffix) {
      return TimeFromStringError::kInvalidFormat;
    }
    const auto ptime{parsePtime(str.substr(0, kIsoLength - 1))};
    if (!ptime) {
      return TimeFromStringError::kInvalidFormat;
    }
    return UnixTime{(*ptime - epoch()).total_seconds()};
  }
}  // namespace fibon::clock
