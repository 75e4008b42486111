/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "vm/state/impl/state_tree_impl.hpp"

#include <cassert>

OUTCOME_CPP_DEFINE_CATEGORY(fibon::vm::state, StateTreeError, e) {
  using E = fibon::vm::state::StateTreeError;
  switch (e) {
    case E::kStateNotFound:
      return "StateTreeError: no actor at address";
    case E::kActorExists:
      return "StateTreeError: address already taken";
  }
  return "StateTreeError: unknown";
}

namespace fibon::vm::state {

  StateTreeImpl::StateTreeImpl() {
    // txBegin() is virtual and should not be used in the constructor
    tx_.emplace_back();
    tx_.back().next_id = next_id_;
  }

  outcome::result<void> StateTreeImpl::set(const Address &address,
                                           const Actor &actor) {
    setActor(address.getId(), actor);
    return outcome::success();
  }

  outcome::result<boost::optional<Actor>> StateTreeImpl::tryGet(
      const Address &address) const {
    const auto id{address.getId()};
    for (auto it{tx_.rbegin()}; it != tx_.rend(); ++it) {
      if (it->removed.count(id) != 0) {
        return boost::none;
      }
      const auto actor{it->actors.find(id)};
      if (actor != it->actors.end()) {
        return actor->second;
      }
    }
    return boost::none;
  }

  outcome::result<Address> StateTreeImpl::registerNewAddress(
      const Actor &actor) {
    const auto address{Address::makeFromId(next_id_)};
    OUTCOME_TRY(existing, tryGet(address));
    if (existing) {
      return StateTreeError::kActorExists;
    }
    ++next_id_;
    setActor(address.getId(), actor);
    return address;
  }

  outcome::result<void> StateTreeImpl::remove(const Address &address) {
    OUTCOME_TRY(get(address));
    tx_.back().actors.erase(address.getId());
    tx_.back().removed.insert(address.getId());
    return outcome::success();
  }

  void StateTreeImpl::emitEvent(ActorEvent event) {
    tx_.back().events.push_back(std::move(event));
  }

  std::vector<ActorEvent> StateTreeImpl::takeEvents() {
    std::vector<ActorEvent> events;
    std::swap(events, tx_.back().events);
    return events;
  }

  void StateTreeImpl::txBegin() {
    tx_.emplace_back();
    tx_.back().next_id = next_id_;
  }

  void StateTreeImpl::txRevert() {
    next_id_ = tx_.back().next_id;
    tx_.back() = {};
    tx_.back().next_id = next_id_;
  }

  void StateTreeImpl::txEnd() {
    assert(tx_.size() > 1);
    auto top{std::move(tx_.back())};
    tx_.pop_back();
    for (auto id : top.removed) {
      tx_.back().actors.erase(id);
      tx_.back().removed.insert(id);
    }
    for (auto &[id, actor] : top.actors) {
      tx_.back().actors[id] = std::move(actor);
      tx_.back().removed.erase(id);
    }
    for (auto &event : top.events) {
      tx_.back().events.push_back(std::move(event));
    }
  }

  std::vector<Address> StateTreeImpl::actorAddresses() const {
    std::set<ActorId> ids;
    for (const auto &tx : tx_) {
      for (const auto &id : tx.removed) {
        ids.erase(id);
      }
      for (const auto &[id, actor] : tx.actors) {
        ids.insert(id);
      }
    }
    std::vector<Address> addresses;
    for (const auto &id : ids) {
      addresses.push_back(Address::makeFromId(id));
    }
    return addresses;
  }

  void StateTreeImpl::setActor(ActorId id, const Actor &actor) {
    tx_.back().actors[id] = actor;
    tx_.back().removed.erase(id);
  }
}  // namespace fibon::vm::state
