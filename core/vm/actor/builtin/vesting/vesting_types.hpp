/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "codec/cbor/streams_annotation.hpp"
#include "primitives/types.hpp"

namespace fibon::vm::actor::builtin::vesting {
  using primitives::BigInt;
  using primitives::Duration;
  using primitives::TokenAmount;
  using primitives::UnixTime;

  using VestingTypeId = uint64_t;

  /**
   * Interval relative to schedule start unlocking percentage of allocation
   * linearly. Phase with start == end unlocks instantly.
   */
  struct VestingPhase {
    Duration start{};
    Duration end{};
    /// Non-cumulative percent of allocation, 0..100
    uint64_t percentage{};

    inline bool operator==(const VestingPhase &other) const {
      return start == other.start && end == other.end
             && percentage == other.percentage;
    }
  };
  CBOR_TUPLE(VestingPhase, start, end, percentage)

  using VestingPhases = std::vector<VestingPhase>;

  /**
   * Allocation of beneficiary, phases are copied from vesting type
   */
  struct VestingSchedule {
    UnixTime start_time{};
    TokenAmount total_allocation{};
    TokenAmount released{};
    VestingPhases phases;
    /// No further vesting or release after disable
    bool disabled{false};

    inline bool operator==(const VestingSchedule &other) const {
      return start_time == other.start_time
             && total_allocation == other.total_allocation
             && released == other.released && phases == other.phases
             && disabled == other.disabled;
    }
  };
  CBOR_TUPLE(VestingSchedule,
             start_time,
             total_allocation,
             released,
             phases,
             disabled)
}  // namespace fibon::vm::actor::builtin::vesting
