/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "vm/actor/builtin/vesting/vesting_math.hpp"

#include "common/math/math.hpp"
#include "vm/exit_code/exit_code.hpp"

namespace fibon::vm::actor::builtin::vesting {
  using common::math::kPrecision18;
  using common::math::toFixed18;

  bool validatePhases(const VestingPhases &phases) {
    if (phases.empty()) {
      return false;
    }
    uint64_t total{0};
    for (size_t i{0}; i < phases.size(); ++i) {
      const auto &phase{phases[i]};
      if (phase.start < 0 || phase.start > phase.end
          || phase.percentage > kTotalPercentage) {
        return false;
      }
      if (i != 0 && phase.start < phases[i - 1].end) {
        return false;
      }
      total += phase.percentage;
    }
    return total == kTotalPercentage;
  }

  BigInt phaseProgress(const VestingPhase &phase,
                       UnixTime start_time,
                       UnixTime now) {
    const BigInt phase_start{BigInt{start_time} + phase.start};
    const BigInt phase_end{BigInt{start_time} + phase.end};
    if (now < phase_start) {
      return 0;
    }
    if (now >= phase_end) {
      return kPrecision18;
    }
    return toFixed18(now - phase_start, phase_end - phase_start);
  }

  outcome::result<TokenAmount> vestedAmount(const VestingSchedule &schedule,
                                            UnixTime now) {
    if (schedule.disabled) {
      return schedule.total_allocation;
    }
    BigInt sum{0};
    for (const auto &phase : schedule.phases) {
      sum += schedule.total_allocation * phase.percentage
             * phaseProgress(phase, schedule.start_time, now);
    }
    TokenAmount vested{bigdiv(sum, kPrecision18 * kTotalPercentage)};
    if (vested < 0 || vested > schedule.total_allocation) {
      return outcome::failure(VMExitCode::kErrBalanceInvariantBroken);
    }
    return vested;
  }

  outcome::result<TokenAmount> releasableAmount(const VestingSchedule &schedule,
                                                UnixTime now) {
    if (schedule.disabled) {
      return TokenAmount{0};
    }
    OUTCOME_TRY(vested, vestedAmount(schedule, now));
    if (vested < schedule.released) {
      return outcome::failure(VMExitCode::kErrBalanceInvariantBroken);
    }
    return vested - schedule.released;
  }

  outcome::result<uint64_t> vestedPercentage(const VestingSchedule &schedule,
                                             UnixTime now) {
    if (schedule.total_allocation == 0) {
      return uint64_t{0};
    }
    OUTCOME_TRY(vested, vestedAmount(schedule, now));
    const BigInt bp{bigdiv(vested * kBasisPoints, schedule.total_allocation)};
    return bp.convert_to<uint64_t>();
  }

}  // namespace fibon::vm::actor::builtin::vesting
