/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/clock.hpp"
#include "common/logger.hpp"
#include "primitives/types.hpp"
#include "vm/actor/invoker.hpp"
#include "vm/runtime/runtime_types.hpp"
#include "vm/state/impl/state_tree_impl.hpp"

namespace fibon::vm::runtime {
  using actor::Actor;
  using actor::CodeId;
  using actor::Invoker;
  using actor::MethodParams;
  using primitives::TokenAmount;
  using primitives::UnixTime;
  using state::StateTreeImpl;

  /// Environment contains objects that are shared by runtime contexts
  struct Env : std::enable_shared_from_this<Env> {
    Env(std::shared_ptr<Invoker> invoker,
        std::shared_ptr<clock::Clock> clock);

    /// Creates environment with system actor
    static outcome::result<std::shared_ptr<Env>> make(
        std::shared_ptr<Invoker> invoker,
        std::shared_ptr<clock::Clock> clock);

    /**
     * Applies message sent by account actor.
     * All changes are reverted if message fails.
     * @return receipt, error only if message could not be applied
     */
    outcome::result<MessageReceipt> applyMessage(
        const UnsignedMessage &message);

    /// Applies message without sender validation
    outcome::result<MessageReceipt> applyImplicitMessage(
        const UnsignedMessage &message);

    /// Applies message and reverts all its changes
    outcome::result<MessageReceipt> call(const UnsignedMessage &message);

    /// Creates account actor holding balance
    outcome::result<Address> createAccount(const TokenAmount &balance);

    /**
     * Creates actor and calls its constructor from system actor.
     * Nothing is created if constructor fails.
     * @param code - actor code
     * @param params - constructor params
     * @param balance - initial actor balance
     * @return address of created actor
     */
    outcome::result<Address> deployActor(const CodeId &code,
                                         const MethodParams &params,
                                         const TokenAmount &balance);

    std::shared_ptr<Invoker> invoker;
    std::shared_ptr<StateTreeImpl> state_tree;
    std::shared_ptr<clock::Clock> clock;
    common::Logger logger;
  };

  struct Execution : std::enable_shared_from_this<Execution> {
    /// Samples environment clock, time is fixed for whole execution
    static std::shared_ptr<Execution> make(const std::shared_ptr<Env> &env,
                                           const UnsignedMessage &message);

    /// Sends message reverting all changes on failure
    outcome::result<InvocationOutput> sendWithRevert(
        const UnsignedMessage &message);

    outcome::result<InvocationOutput> send(const UnsignedMessage &message);

    std::shared_ptr<Env> env;
    std::shared_ptr<StateTreeImpl> state_tree;
    UnixTime now{};
    Address origin;
  };
}  // namespace fibon::vm::runtime
