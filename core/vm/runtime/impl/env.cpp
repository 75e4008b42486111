/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "vm/runtime/env.hpp"

#include <gsl/gsl_util>

#include "vm/actor/codes.hpp"
#include "vm/exit_code/exit_code.hpp"
#include "vm/runtime/impl/runtime_impl.hpp"

namespace fibon::vm::runtime {
  using actor::kConstructorMethodNumber;
  using actor::kSystemActorAddress;
  using actor::builtin::kAccountCodeId;
  using actor::builtin::kSystemCodeId;

  Env::Env(std::shared_ptr<Invoker> invoker,
           std::shared_ptr<clock::Clock> clock)
      : invoker{std::move(invoker)},
        state_tree{std::make_shared<StateTreeImpl>()},
        clock{std::move(clock)},
        logger{common::createLogger("vm")} {}

  outcome::result<std::shared_ptr<Env>> Env::make(
      std::shared_ptr<Invoker> invoker,
      std::shared_ptr<clock::Clock> clock) {
    auto env{std::make_shared<Env>(std::move(invoker), std::move(clock))};
    OUTCOME_TRY(env->state_tree->set(kSystemActorAddress,
                                     Actor{kSystemCodeId, {}, 0}));
    return env;
  }

  outcome::result<MessageReceipt> Env::applyMessage(
      const UnsignedMessage &message) {
    OUTCOME_TRY(maybe_from, state_tree->tryGet(message.from));
    if (!maybe_from || maybe_from->code != kAccountCodeId) {
      logger->warn("message from {} rejected: invalid sender", message.from);
      return MessageReceipt{VMExitCode::kSysErrSenderInvalid, {}, {}};
    }
    return applyImplicitMessage(message);
  }

  outcome::result<MessageReceipt> Env::applyImplicitMessage(
      const UnsignedMessage &message) {
    auto execution = Execution::make(shared_from_this(), message);
    logger->debug("apply {} -> {} method {} value {}",
                  message.from,
                  message.to,
                  message.method,
                  message.value.str());
    MessageReceipt receipt;
    auto result{execution->sendWithRevert(message)};
    if (!result) {
      OUTCOME_TRYA(receipt.exit_code, asExitCode(result.error()));
      logger->warn("message {} -> {} method {} failed with exit code {}",
                   message.from,
                   message.to,
                   message.method,
                   static_cast<int64_t>(receipt.exit_code));
    } else {
      receipt.exit_code = VMExitCode::kOk;
      receipt.return_value = std::move(result.value());
    }
    receipt.events = state_tree->takeEvents();
    return receipt;
  }

  outcome::result<MessageReceipt> Env::call(const UnsignedMessage &message) {
    state_tree->txBegin();
    auto BOOST_OUTCOME_TRY_UNIQUE_NAME{gsl::finally([&] {
      state_tree->txRevert();
      state_tree->txEnd();
    })};
    return applyImplicitMessage(message);
  }

  outcome::result<Address> Env::createAccount(const TokenAmount &balance) {
    return state_tree->registerNewAddress(Actor{kAccountCodeId, {}, balance});
  }

  outcome::result<Address> Env::deployActor(const CodeId &code,
                                            const MethodParams &params,
                                            const TokenAmount &balance) {
    state_tree->txBegin();
    auto BOOST_OUTCOME_TRY_UNIQUE_NAME{
        gsl::finally([&] { state_tree->txEnd(); })};
    auto result{[&]() -> outcome::result<Address> {
      OUTCOME_TRY(address,
                  state_tree->registerNewAddress(Actor{code, {}, balance}));
      OUTCOME_TRY(receipt,
                  applyImplicitMessage({address,
                                        kSystemActorAddress,
                                        0,
                                        kConstructorMethodNumber,
                                        params}));
      if (receipt.exit_code != VMExitCode::kOk) {
        return receipt.exit_code;
      }
      return address;
    }()};
    if (!result) {
      state_tree->txRevert();
    }
    return result;
  }

  std::shared_ptr<Execution> Execution::make(const std::shared_ptr<Env> &env,
                                             const UnsignedMessage &message) {
    auto execution{std::make_shared<Execution>()};
    execution->env = env;
    execution->state_tree = env->state_tree;
    execution->now = env->clock->now().count();
    execution->origin = message.from;
    return execution;
  }

  outcome::result<InvocationOutput> Execution::sendWithRevert(
      const UnsignedMessage &message) {
    state_tree->txBegin();
    auto BOOST_OUTCOME_TRY_UNIQUE_NAME{
        gsl::finally([&] { state_tree->txEnd(); })};
    auto result = send(message);
    if (!result) {
      state_tree->txRevert();
      return result.error();
    }
    return result;
  }

  outcome::result<InvocationOutput> Execution::send(
      const UnsignedMessage &message) {
    OUTCOME_TRY(maybe_to_actor, state_tree->tryGet(message.to));
    if (!maybe_to_actor) {
      return VMExitCode::kSysErrInvalidReceiver;
    }
    auto to_actor{maybe_to_actor.value()};

    if (message.value != 0) {
      if (message.value < 0) {
        return VMExitCode::kSysErrForbidden;
      }
      OUTCOME_TRY(maybe_from_actor, state_tree->tryGet(message.from));
      if (!maybe_from_actor) {
        return VMExitCode::kSysErrSenderInvalid;
      }
      auto from_actor{maybe_from_actor.value()};
      if (from_actor.balance < message.value) {
        return VMExitCode::kSysErrInsufficientFunds;
      }
      if (message.to != message.from) {
        from_actor.balance -= message.value;
        to_actor.balance += message.value;
        OUTCOME_TRY(state_tree->set(message.from, from_actor));
        OUTCOME_TRY(state_tree->set(message.to, to_actor));
      }
    }

    RuntimeImpl runtime{shared_from_this(), message};
    auto result{env->invoker->invoke(to_actor.code, runtime)};
    catchAbort(result);
    return result;
  }
}  // namespace fibon::vm::runtime
