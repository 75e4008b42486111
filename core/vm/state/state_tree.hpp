/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include <boost/optional.hpp>

#include "primitives/types.hpp"
#include "vm/actor/actor.hpp"
#include "vm/runtime/runtime_types.hpp"

namespace fibon::vm::state {
  enum class StateTreeError {
    kStateNotFound = 1,
    kActorExists,
  };
}  // namespace fibon::vm::state

OUTCOME_HPP_DECLARE_ERROR(fibon::vm::state, StateTreeError);

namespace fibon::vm::state {
  using actor::Actor;
  using primitives::ActorId;
  using primitives::address::Address;
  using runtime::ActorEvent;

  /**
   * State tree keeps actors by id and events emitted since last take.
   * Changes are layered, every layer may be reverted as a whole.
   */
  class StateTree {
   public:
    virtual ~StateTree() = default;

    /// Set actor state
    virtual outcome::result<void> set(const Address &address,
                                      const Actor &actor) = 0;

    /// Get actor state
    virtual outcome::result<boost::optional<Actor>> tryGet(
        const Address &address) const = 0;

    outcome::result<Actor> get(const Address &address) const {
      OUTCOME_TRY(actor, tryGet(address));
      if (actor) {
        return *actor;
      }
      return StateTreeError::kStateNotFound;
    }

    /// Allocate id address and set actor state
    virtual outcome::result<Address> registerNewAddress(const Actor &actor) = 0;

    virtual outcome::result<void> remove(const Address &address) = 0;

    /// Append event to current layer
    virtual void emitEvent(ActorEvent event) = 0;

    /// Get and clear events of current layer
    virtual std::vector<ActorEvent> takeEvents() = 0;

    virtual void txBegin() = 0;
    virtual void txRevert() = 0;
    virtual void txEnd() = 0;
  };
}  // namespace fibon::vm::state
