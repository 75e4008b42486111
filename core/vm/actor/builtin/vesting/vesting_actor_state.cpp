/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "vm/actor/builtin/vesting/vesting_actor_state.hpp"

#include "vm/exit_code/exit_code.hpp"

namespace fibon::vm::actor::builtin::vesting {

  outcome::result<VestingPhases> VestingActorState::getVestingType(
      const VestingTypeId &type_id) const {
    const auto it{vesting_types.find(type_id)};
    if (it == vesting_types.end()) {
      return VMExitCode::kErrNotFound;
    }
    return it->second;
  }

  outcome::result<VestingSchedule> VestingActorState::getSchedule(
      const Address &beneficiary) const {
    const auto it{schedules.find(beneficiary)};
    if (it == schedules.end()) {
      return VMExitCode::kErrNotFound;
    }
    return it->second;
  }

}  // namespace fibon::vm::actor::builtin::vesting
