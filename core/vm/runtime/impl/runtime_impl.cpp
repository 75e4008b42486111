/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "vm/runtime/impl/runtime_impl.hpp"

namespace fibon::vm::runtime {

  RuntimeImpl::RuntimeImpl(std::shared_ptr<Execution> execution,
                           UnsignedMessage message)
      : execution_{std::move(execution)}, message_{std::move(message)} {}

  UnixTime RuntimeImpl::getCurrentTime() const {
    return execution_->now;
  }

  Address RuntimeImpl::getImmediateCaller() const {
    return message_.from;
  }

  Address RuntimeImpl::getCurrentReceiver() const {
    return message_.to;
  }

  outcome::result<TokenAmount> RuntimeImpl::getBalance(
      const Address &address) const {
    OUTCOME_TRY(actor, execution_->state_tree->tryGet(address));
    return actor ? actor->balance : TokenAmount{0};
  }

  TokenAmount RuntimeImpl::getValueReceived() const {
    return message_.value;
  }

  outcome::result<InvocationOutput> RuntimeImpl::send(
      const Address &to_address,
      MethodNumber method_number,
      MethodParams params,
      const TokenAmount &value) {
    UnsignedMessage nested{
        to_address, message_.to, value, method_number, std::move(params)};
    return execution_->sendWithRevert(nested);
  }

  const UnsignedMessage &RuntimeImpl::getMessage() const {
    return message_;
  }

  outcome::result<Actor> RuntimeImpl::receiverActor() const {
    return execution_->state_tree->get(message_.to);
  }

  outcome::result<Bytes> RuntimeImpl::getActorHead() const {
    OUTCOME_TRY(actor, receiverActor());
    return std::move(actor.head);
  }

  outcome::result<void> RuntimeImpl::commit(const Bytes &new_state) {
    OUTCOME_TRY(actor, receiverActor());
    actor.head = new_state;
    return execution_->state_tree->set(message_.to, actor);
  }

  outcome::result<void> RuntimeImpl::emitEvent(std::string_view name,
                                               const Bytes &data) {
    execution_->state_tree->emitEvent({message_.to, std::string{name}, data});
    return outcome::success();
  }
}  // namespace fibon::vm::runtime
