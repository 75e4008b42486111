/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "vm/actor/builtin/vesting/vesting_actor.hpp"

#include "common/logger.hpp"
#include "vm/actor/builtin/token/token_actor.hpp"
#include "vm/actor/builtin/vesting/vesting_events.hpp"
#include "vm/actor/builtin/vesting/vesting_math.hpp"

namespace fibon::vm::actor::builtin::vesting {

  namespace {
    common::Logger logger() {
      static common::Logger logger{common::createLogger("vesting")};
      return logger;
    }

    outcome::result<void> assertCallerIsOwner(
        const Runtime &runtime, const VestingActorState &state) {
      if (runtime.getImmediateCaller() != state.owner) {
        ABORT(VMExitCode::kErrForbidden);
      }
      return outcome::success();
    }

    /// Token balance of vesting actor, read from ledger every time
    outcome::result<TokenAmount> custodyBalance(Runtime &runtime,
                                                const Address &token) {
      REQUIRE_SUCCESS_A(balance,
                        runtime.sendM<token::BalanceOf>(
                            token, {runtime.getCurrentReceiver()}, 0));
      return std::move(balance);
    }

    outcome::result<void> transferTokens(Runtime &runtime,
                                         const Address &token,
                                         const Address &to,
                                         const TokenAmount &amount) {
      REQUIRE_SUCCESS(
          runtime.sendM<token::Transfer>(token, {to, amount}, 0));
      return outcome::success();
    }
  }  // namespace

  // Construct
  //============================================================================

  ACTOR_METHOD_IMPL(Construct) {
    OUTCOME_TRY(runtime.validateImmediateCallerIs(kSystemActorAddress));
    VestingActorState state;
    state.token = params.token;
    state.owner = params.owner;
    OUTCOME_TRY(runtime.commitState(state));
    return outcome::success();
  }

  // AddVestingType
  //============================================================================

  ACTOR_METHOD_IMPL(AddVestingType) {
    OUTCOME_TRY(state, runtime.getActorState<VestingActorState>());
    OUTCOME_TRY(assertCallerIsOwner(runtime, state));
    VALIDATE_ARG(state.vesting_types.count(params.type_id) == 0);
    VALIDATE_ARG(validatePhases(params.phases));

    state.vesting_types.emplace(params.type_id, params.phases);
    OUTCOME_TRY(runtime.commitState(state));
    OUTCOME_TRY(runtime.emitEventM(VestingTypeAddedEvent{params.type_id}));
    return outcome::success();
  }

  // CreateVestingSchedule
  //============================================================================

  outcome::result<void> CreateVestingSchedule::createSchedule(
      Runtime &runtime,
      VestingActorState &state,
      const TokenAmount &custody,
      const Params &params) {
    VALIDATE_ARG(params.amount > 0);
    VALIDATE_ARG(state.schedules.count(params.beneficiary) == 0);
    REQUIRE_NO_ERROR_A(phases,
                       state.getVestingType(params.type_id),
                       VMExitCode::kErrNotFound);
    REQUIRE_FUNDS(custody >= state.total_allocated + params.amount);
    const auto start_time{params.start_time.value_or(runtime.getCurrentTime())};
    VALIDATE_ARG(start_time >= 0);

    state.schedules[params.beneficiary] =
        VestingSchedule{start_time, params.amount, 0, phases, false};
    state.total_allocated += params.amount;
    OUTCOME_TRY(runtime.emitEventM(VestingScheduleCreatedEvent{
        params.beneficiary, params.type_id, params.amount, start_time}));
    return outcome::success();
  }

  ACTOR_METHOD_IMPL(CreateVestingSchedule) {
    OUTCOME_TRY(state, runtime.getActorState<VestingActorState>());
    OUTCOME_TRY(assertCallerIsOwner(runtime, state));
    OUTCOME_TRY(custody, custodyBalance(runtime, state.token));
    OUTCOME_TRY(createSchedule(runtime, state, custody, params));
    OUTCOME_TRY(runtime.commitState(state));
    return outcome::success();
  }

  ACTOR_METHOD_IMPL(CreateVestingSchedules) {
    OUTCOME_TRY(state, runtime.getActorState<VestingActorState>());
    OUTCOME_TRY(assertCallerIsOwner(runtime, state));
    VALIDATE_ARG(!params.entries.empty());
    OUTCOME_TRY(custody, custodyBalance(runtime, state.token));
    for (const auto &entry : params.entries) {
      OUTCOME_TRY(CreateVestingSchedule::createSchedule(
          runtime, state, custody, entry));
    }
    OUTCOME_TRY(runtime.commitState(state));
    return outcome::success();
  }

  // Release
  //============================================================================

  ACTOR_METHOD_IMPL(Release) {
    OUTCOME_TRY(state, runtime.getActorState<VestingActorState>());
    const auto beneficiary{runtime.getImmediateCaller()};
    auto it{state.schedules.find(beneficiary)};
    REQUIRE_FOUND(it != state.schedules.end());
    auto &schedule{it->second};
    REQUIRE_STATE(!schedule.disabled);
    REQUIRE_NO_ERROR_A(amount,
                       releasableAmount(schedule, runtime.getCurrentTime()),
                       VMExitCode::kErrIllegalState);
    REQUIRE_STATE(amount != 0);

    schedule.released += amount;
    state.total_allocated -= amount;
    REQUIRE_STATE(state.total_allocated >= 0);
    OUTCOME_TRY(runtime.commitState(state));

    OUTCOME_TRY(transferTokens(runtime, state.token, beneficiary, amount));
    OUTCOME_TRY(
        runtime.emitEventM(TokensReleasedEvent{beneficiary, amount}));
    logger()->debug("released {} to {}", amount.str(), beneficiary);
    return std::move(amount);
  }

  // RevokeBeneficiary
  //============================================================================

  ACTOR_METHOD_IMPL(RevokeBeneficiary) {
    OUTCOME_TRY(state, runtime.getActorState<VestingActorState>());
    OUTCOME_TRY(assertCallerIsOwner(runtime, state));
    REQUIRE_NO_ERROR_A(schedule,
                       state.getSchedule(params.beneficiary),
                       VMExitCode::kErrNotFound);

    const TokenAmount remaining{schedule.total_allocation - schedule.released};
    REQUIRE_STATE(remaining >= 0);
    state.schedules.erase(params.beneficiary);
    state.total_allocated -= remaining;
    REQUIRE_STATE(state.total_allocated >= 0);
    OUTCOME_TRY(runtime.commitState(state));

    if (remaining > 0) {
      OUTCOME_TRY(transferTokens(runtime, state.token, state.owner, remaining));
    }
    OUTCOME_TRY(runtime.emitEventM(
        BeneficiaryRevokedEvent{params.beneficiary, remaining}));
    logger()->debug("revoked {}, returned {}",
                    params.beneficiary,
                    remaining.str());
    return outcome::success();
  }

  // DisableVestingSchedule
  //============================================================================

  ACTOR_METHOD_IMPL(DisableVestingSchedule) {
    OUTCOME_TRY(state, runtime.getActorState<VestingActorState>());
    OUTCOME_TRY(assertCallerIsOwner(runtime, state));
    auto it{state.schedules.find(params.beneficiary)};
    REQUIRE_FOUND(it != state.schedules.end());
    auto &schedule{it->second};
    REQUIRE_STATE(!schedule.disabled);
    REQUIRE_NO_ERROR_A(vested,
                       vestedAmount(schedule, runtime.getCurrentTime()),
                       VMExitCode::kErrIllegalState);
    REQUIRE_STATE(vested >= schedule.released);

    const TokenAmount paid{vested - schedule.released};
    const TokenAmount forfeited{schedule.total_allocation - vested};
    state.total_allocated -= paid + forfeited;
    REQUIRE_STATE(state.total_allocated >= 0);
    schedule.total_allocation = vested;
    schedule.released = vested;
    schedule.disabled = true;
    OUTCOME_TRY(runtime.commitState(state));

    if (paid > 0) {
      OUTCOME_TRY(
          transferTokens(runtime, state.token, params.beneficiary, paid));
    }
    OUTCOME_TRY(runtime.emitEventM(
        VestingScheduleDisabledEvent{params.beneficiary, paid, forfeited}));
    logger()->debug("disabled schedule of {}, paid {}, forfeited {}",
                    params.beneficiary,
                    paid.str(),
                    forfeited.str());
    return outcome::success();
  }

  // Read-only
  //============================================================================

  ACTOR_METHOD_IMPL(GetVestedAmount) {
    OUTCOME_TRY(state, runtime.getActorState<VestingActorState>());
    REQUIRE_NO_ERROR_A(schedule,
                       state.getSchedule(params.beneficiary),
                       VMExitCode::kErrNotFound);
    const auto now{runtime.getCurrentTime()};
    REQUIRE_NO_ERROR_A(
        vested, vestedAmount(schedule, now), VMExitCode::kErrIllegalState);
    REQUIRE_NO_ERROR_A(releasable,
                       releasableAmount(schedule, now),
                       VMExitCode::kErrIllegalState);
    return Result{vested, schedule.released, releasable};
  }

  ACTOR_METHOD_IMPL(GetVestedPercentage) {
    OUTCOME_TRY(state, runtime.getActorState<VestingActorState>());
    REQUIRE_NO_ERROR_A(schedule,
                       state.getSchedule(params.beneficiary),
                       VMExitCode::kErrNotFound);
    REQUIRE_NO_ERROR_A(percentage,
                       vestedPercentage(schedule, runtime.getCurrentTime()),
                       VMExitCode::kErrIllegalState);
    return percentage;
  }

  ACTOR_METHOD_IMPL(GetSchedulePhases) {
    OUTCOME_TRY(state, runtime.getActorState<VestingActorState>());
    REQUIRE_NO_ERROR_A(schedule,
                       state.getSchedule(params.beneficiary),
                       VMExitCode::kErrNotFound);
    return std::move(schedule.phases);
  }

  ACTOR_METHOD_IMPL(GetVestingType) {
    OUTCOME_TRY(state, runtime.getActorState<VestingActorState>());
    REQUIRE_NO_ERROR_A(phases,
                       state.getVestingType(params.type_id),
                       VMExitCode::kErrNotFound);
    return std::move(phases);
  }

  ACTOR_METHOD_IMPL(GetSchedule) {
    OUTCOME_TRY(state, runtime.getActorState<VestingActorState>());
    const auto it{state.schedules.find(params.beneficiary)};
    if (it == state.schedules.end()) {
      return Result{};
    }
    return Result{it->second};
  }

  ACTOR_METHOD_IMPL(GetTotalAllocated) {
    OUTCOME_TRY(state, runtime.getActorState<VestingActorState>());
    return state.total_allocated;
  }

  // RecoverToken
  //============================================================================

  ACTOR_METHOD_IMPL(RecoverToken) {
    OUTCOME_TRY(state, runtime.getActorState<VestingActorState>());
    OUTCOME_TRY(assertCallerIsOwner(runtime, state));
    if (params.token == state.token) {
      ABORT(VMExitCode::kErrForbidden);
    }
    VALIDATE_ARG(params.amount > 0);
    OUTCOME_TRY(transferTokens(runtime, params.token, state.owner, params.amount));
    OUTCOME_TRY(runtime.emitEventM(
        TokenRecoveredEvent{params.token, params.amount}));
    return outcome::success();
  }

  //============================================================================

  const ActorExports exports{
      exportMethod<Construct>(),
      exportMethod<AddVestingType>(),
      exportMethod<CreateVestingSchedule>(),
      exportMethod<CreateVestingSchedules>(),
      exportMethod<Release>(),
      exportMethod<RevokeBeneficiary>(),
      exportMethod<DisableVestingSchedule>(),
      exportMethod<GetVestedAmount>(),
      exportMethod<GetVestedPercentage>(),
      exportMethod<GetSchedulePhases>(),
      exportMethod<GetVestingType>(),
      exportMethod<GetSchedule>(),
      exportMethod<GetTotalAllocated>(),
      exportMethod<RecoverToken>(),
  };

}  // namespace fibon::vm::actor::builtin::vesting
