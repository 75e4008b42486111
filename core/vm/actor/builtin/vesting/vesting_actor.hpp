/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>

#include "vm/actor/actor_method.hpp"
#include "vm/actor/builtin/vesting/vesting_actor_state.hpp"

namespace fibon::vm::actor::builtin::vesting {

  struct Construct : ActorMethodBase<1> {
    struct Params {
      Address token;
      Address owner;
    };

    ACTOR_METHOD_DECL();
  };
  CBOR_TUPLE(Construct::Params, token, owner)

  struct AddVestingType : ActorMethodBase<2> {
    struct Params {
      VestingTypeId type_id{};
      VestingPhases phases;
    };

    ACTOR_METHOD_DECL();
  };
  CBOR_TUPLE(AddVestingType::Params, type_id, phases)

  struct CreateVestingSchedule : ActorMethodBase<3> {
    struct Params {
      Address beneficiary;
      VestingTypeId type_id{};
      TokenAmount amount;
      /// Current time if not set
      boost::optional<UnixTime> start_time;
    };

    ACTOR_METHOD_DECL();

    /**
     * Adds schedule to state
     * @param custody - token balance of vesting actor
     */
    static outcome::result<void> createSchedule(Runtime &runtime,
                                                VestingActorState &state,
                                                const TokenAmount &custody,
                                                const Params &params);
  };
  CBOR_TUPLE(CreateVestingSchedule::Params,
             beneficiary,
             type_id,
             amount,
             start_time)

  /// All schedules are created or none
  struct CreateVestingSchedules : ActorMethodBase<4> {
    struct Params {
      std::vector<CreateVestingSchedule::Params> entries;
    };

    ACTOR_METHOD_DECL();
  };
  CBOR_TUPLE(CreateVestingSchedules::Params, entries)

  /// Transfers releasable tokens to caller
  struct Release : ActorMethodBase<5> {
    using Result = TokenAmount;

    ACTOR_METHOD_DECL();
  };

  struct RevokeBeneficiary : ActorMethodBase<6> {
    struct Params {
      Address beneficiary;
    };

    ACTOR_METHOD_DECL();
  };
  CBOR_TUPLE(RevokeBeneficiary::Params, beneficiary)

  struct DisableVestingSchedule : ActorMethodBase<7> {
    using Params = RevokeBeneficiary::Params;

    ACTOR_METHOD_DECL();
  };

  struct GetVestedAmount : ActorMethodBase<8> {
    using Params = RevokeBeneficiary::Params;
    struct Result {
      TokenAmount vested;
      TokenAmount released;
      TokenAmount releasable;

      inline bool operator==(const Result &rhs) const {
        return vested == rhs.vested && released == rhs.released
               && releasable == rhs.releasable;
      }
    };

    ACTOR_METHOD_DECL();
  };
  CBOR_TUPLE(GetVestedAmount::Result, vested, released, releasable)

  /// Vested part of allocation in basis points
  struct GetVestedPercentage : ActorMethodBase<9> {
    using Params = RevokeBeneficiary::Params;
    using Result = uint64_t;

    ACTOR_METHOD_DECL();
  };

  struct GetSchedulePhases : ActorMethodBase<10> {
    using Params = RevokeBeneficiary::Params;
    using Result = VestingPhases;

    ACTOR_METHOD_DECL();
  };

  struct GetVestingType : ActorMethodBase<11> {
    struct Params {
      VestingTypeId type_id{};
    };
    using Result = VestingPhases;

    ACTOR_METHOD_DECL();
  };
  CBOR_TUPLE(GetVestingType::Params, type_id)

  /// Schedule of beneficiary, null if none
  struct GetSchedule : ActorMethodBase<12> {
    using Params = RevokeBeneficiary::Params;
    using Result = boost::optional<VestingSchedule>;

    ACTOR_METHOD_DECL();
  };

  struct GetTotalAllocated : ActorMethodBase<13> {
    using Result = TokenAmount;

    ACTOR_METHOD_DECL();
  };

  /// Returns tokens of other ledger sent to vesting actor by mistake
  struct RecoverToken : ActorMethodBase<14> {
    struct Params {
      Address token;
      TokenAmount amount;
    };

    ACTOR_METHOD_DECL();
  };
  CBOR_TUPLE(RecoverToken::Params, token, amount)

  /** Exported Vesting Actor methods to invoker */
  extern const ActorExports exports;

}  // namespace fibon::vm::actor::builtin::vesting
