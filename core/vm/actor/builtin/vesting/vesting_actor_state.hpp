/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>

#include "common/outcome.hpp"
#include "primitives/address/address_codec.hpp"
#include "vm/actor/builtin/vesting/vesting_types.hpp"

namespace fibon::vm::actor::builtin::vesting {
  using primitives::address::Address;

  /**
   * State of Vesting Actor instance
   */
  struct VestingActorState {
    /// Vested token ledger
    Address token;
    /// Administrator
    Address owner;
    /// Catalog of phase templates, entries are never changed
    std::map<VestingTypeId, VestingPhases> vesting_types;
    std::map<Address, VestingSchedule> schedules;
    /// Allocated and not yet released or terminated tokens
    TokenAmount total_allocated{};

    outcome::result<VestingPhases> getVestingType(
        const VestingTypeId &type_id) const;

    outcome::result<VestingSchedule> getSchedule(
        const Address &beneficiary) const;
  };
  CBOR_TUPLE(VestingActorState,
             token,
             owner,
             vesting_types,
             schedules,
             total_allocated)

}  // namespace fibon::vm::actor::builtin::vesting
