/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "vm/actor/builtin/token/token_actor.hpp"

namespace fibon::vm::actor::builtin::token {

  ACTOR_METHOD_IMPL(Construct) {
    OUTCOME_TRY(runtime.validateImmediateCallerIs(kSystemActorAddress));
    TokenActorState state;
    state.owner = params.owner;
    OUTCOME_TRY(runtime.commitState(state));
    return outcome::success();
  }

  ACTOR_METHOD_IMPL(Mint) {
    OUTCOME_TRY(state, runtime.getActorState<TokenActorState>());
    if (runtime.getImmediateCaller() != state.owner) {
      ABORT(VMExitCode::kErrForbidden);
    }
    VALIDATE_ARG(params.amount > 0);
    state.mint(params.to, params.amount);
    OUTCOME_TRY(runtime.commitState(state));
    OUTCOME_TRY(runtime.emitEventM(
        TransferEvent{boost::none, params.to, params.amount}));
    return outcome::success();
  }

  ACTOR_METHOD_IMPL(Transfer) {
    VALIDATE_ARG(params.amount >= 0);
    OUTCOME_TRY(state, runtime.getActorState<TokenActorState>());
    const auto caller{runtime.getImmediateCaller()};
    REQUIRE_SUCCESS(state.transfer(caller, params.to, params.amount));
    OUTCOME_TRY(runtime.commitState(state));
    OUTCOME_TRY(runtime.emitEventM(
        TransferEvent{caller, params.to, params.amount}));
    return outcome::success();
  }

  ACTOR_METHOD_IMPL(BalanceOf) {
    OUTCOME_TRY(state, runtime.getActorState<TokenActorState>());
    return state.balanceOf(params.address);
  }

  ACTOR_METHOD_IMPL(Approve) {
    VALIDATE_ARG(params.amount >= 0);
    OUTCOME_TRY(state, runtime.getActorState<TokenActorState>());
    const auto caller{runtime.getImmediateCaller()};
    state.setAllowance(caller, params.spender, params.amount);
    OUTCOME_TRY(runtime.commitState(state));
    OUTCOME_TRY(runtime.emitEventM(
        ApprovalEvent{caller, params.spender, params.amount}));
    return outcome::success();
  }

  ACTOR_METHOD_IMPL(TransferFrom) {
    VALIDATE_ARG(params.amount >= 0);
    OUTCOME_TRY(state, runtime.getActorState<TokenActorState>());
    REQUIRE_SUCCESS(state.spendAllowance(
        params.from, runtime.getImmediateCaller(), params.amount));
    REQUIRE_SUCCESS(state.transfer(params.from, params.to, params.amount));
    OUTCOME_TRY(runtime.commitState(state));
    OUTCOME_TRY(runtime.emitEventM(
        TransferEvent{params.from, params.to, params.amount}));
    return outcome::success();
  }

  ACTOR_METHOD_IMPL(BurnFrom) {
    VALIDATE_ARG(params.amount >= 0);
    OUTCOME_TRY(state, runtime.getActorState<TokenActorState>());
    REQUIRE_SUCCESS(state.spendAllowance(
        params.from, runtime.getImmediateCaller(), params.amount));
    REQUIRE_SUCCESS(state.burn(params.from, params.amount));
    OUTCOME_TRY(runtime.commitState(state));
    OUTCOME_TRY(runtime.emitEventM(
        TransferEvent{params.from, boost::none, params.amount}));
    return outcome::success();
  }

  ACTOR_METHOD_IMPL(TotalSupply) {
    OUTCOME_TRY(state, runtime.getActorState<TokenActorState>());
    return state.total_supply;
  }

  ACTOR_METHOD_IMPL(Allowance) {
    OUTCOME_TRY(state, runtime.getActorState<TokenActorState>());
    return state.allowance(params.owner, params.spender);
  }

  const ActorExports exports{
      exportMethod<Construct>(),
      exportMethod<Mint>(),
      exportMethod<Transfer>(),
      exportMethod<BalanceOf>(),
      exportMethod<Approve>(),
      exportMethod<TransferFrom>(),
      exportMethod<BurnFrom>(),
      exportMethod<TotalSupply>(),
      exportMethod<Allowance>(),
  };

}  // namespace fibon::vm::actor::builtin::token
