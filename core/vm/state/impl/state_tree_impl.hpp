/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <set>

#include "vm/state/state_tree.hpp"

namespace fibon::vm::state {

  /// In-memory state tree
  class StateTreeImpl : public StateTree {
   public:
    StateTreeImpl();

    outcome::result<void> set(const Address &address,
                              const Actor &actor) override;

    outcome::result<boost::optional<Actor>> tryGet(
        const Address &address) const override;

    /**
     * Allocate next free id address
     * @param actor - initial actor state
     */
    outcome::result<Address> registerNewAddress(const Actor &actor) override;

    outcome::result<void> remove(const Address &address) override;

    void emitEvent(ActorEvent event) override;

    std::vector<ActorEvent> takeEvents() override;

    void txBegin() override;
    void txRevert() override;
    void txEnd() override;

    /// Ids of all live actors in ascending order
    std::vector<Address> actorAddresses() const;

   private:
    struct Tx {
      std::map<ActorId, Actor> actors;
      std::set<ActorId> removed;
      std::vector<ActorEvent> events;
      /// Next free id when layer began
      ActorId next_id{};
    };

    void setActor(ActorId id, const Actor &actor);

    std::vector<Tx> tx_;
    ActorId next_id_{actor::kFirstNonSingletonActorId};
  };
}  // namespace fibon::vm::state
