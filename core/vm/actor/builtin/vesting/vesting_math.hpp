/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"
#include "vm/actor/builtin/vesting/vesting_types.hpp"

namespace fibon::vm::actor::builtin::vesting {

  /// Percentages of phases sum up to
  constexpr uint64_t kTotalPercentage{100};

  /// Scale of vested percentage, basis points
  constexpr uint64_t kBasisPoints{10000};

  /**
   * Checks phases of vesting type.
   * Phases are non-empty, ordered, non-overlapping (gaps allowed), every phase
   * has start <= end and percentages sum up to 100.
   */
  bool validatePhases(const VestingPhases &phases);

  /**
   * Unlocked part of phase at time as Q.18 fixed point, from 0 to 1
   * @param phase - phase
   * @param start_time - schedule start
   * @param now - current time
   */
  BigInt phaseProgress(const VestingPhase &phase,
                       UnixTime start_time,
                       UnixTime now);

  /**
   * Amount vested at time.
   * Sum of allocation * percentage * progress over phases, rounded down once.
   * Disabled schedule is vested up to its clamped allocation.
   * @return vested amount or kErrBalanceInvariantBroken if it would exceed
   * allocation
   */
  outcome::result<TokenAmount> vestedAmount(const VestingSchedule &schedule,
                                            UnixTime now);

  /// Vested and not released amount, zero for disabled schedule
  outcome::result<TokenAmount> releasableAmount(const VestingSchedule &schedule,
                                                UnixTime now);

  /// Vested part of allocation in basis points
  outcome::result<uint64_t> vestedPercentage(const VestingSchedule &schedule,
                                             UnixTime now);

}  // namespace fibon::vm::actor::builtin::vesting
