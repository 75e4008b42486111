/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include "primitives/address/address.hpp"
#include "primitives/types.hpp"
#include "vm/actor/actor.hpp"
#include "vm/actor/actor_encoding.hpp"
#include "vm/exit_code/exit_code.hpp"
#include "vm/message/message.hpp"
#include "vm/runtime/runtime_types.hpp"

namespace fibon::vm::runtime {

  using actor::MethodNumber;
  using actor::MethodParams;
  using message::UnsignedMessage;
  using primitives::TokenAmount;
  using primitives::UnixTime;
  using primitives::address::Address;

  /**
   * Context of one actor method invocation. Gives access to the message,
   * state of receiving actor, balances and nested sends.
   */
  class Runtime {
   public:
    virtual ~Runtime() = default;

    /// Seconds since unix epoch, fixed while one top level message applies
    virtual UnixTime getCurrentTime() const = 0;

    /// Sender of current invocation, may differ from origin of message chain
    virtual Address getImmediateCaller() const = 0;

    virtual Address getCurrentReceiver() const = 0;

    /// Zero for address without actor
    virtual outcome::result<TokenAmount> getBalance(
        const Address &address) const = 0;

    virtual TokenAmount getValueReceived() const = 0;

    /**
     * Invokes method of another actor transferring value from current
     * receiver. State changes of failed call are reverted.
     * @return encoded result or exit code of failed call
     */
    virtual outcome::result<InvocationOutput> send(
        const Address &to_address,
        MethodNumber method_number,
        MethodParams params,
        const TokenAmount &value) = 0;

    virtual const UnsignedMessage &getMessage() const = 0;

    /// Encoded state of current receiver
    virtual outcome::result<Bytes> getActorHead() const = 0;

    virtual outcome::result<void> commit(const Bytes &new_state) = 0;

    /// Appends event of current receiver to message receipt
    virtual outcome::result<void> emitEvent(std::string_view name,
                                            const Bytes &data) = 0;

    template <typename M>
    outcome::result<typename M::Result> sendM(const Address &address,
                                              const typename M::Params &params,
                                              const TokenAmount &value) {
      OUTCOME_TRY(encoded, actor::encodeActorParams(params));
      OUTCOME_TRY(output, send(address, M::Number, encoded, value));
      return actor::decodeActorReturn<typename M::Result>(output);
    }

    template <typename T>
    outcome::result<T> getActorState() const {
      OUTCOME_TRY(head, getActorHead());
      return codec::cbor::decode<T>(head);
    }

    template <typename T>
    outcome::result<void> commitState(const T &state) {
      OUTCOME_TRY(head, codec::cbor::encode(state));
      return commit(head);
    }

    /// Emits event named E::kName
    template <typename E>
    outcome::result<void> emitEventM(const E &event) {
      OUTCOME_TRY(data, codec::cbor::encode(event));
      return emitEvent(E::kName, data);
    }

    outcome::result<TokenAmount> getCurrentBalance() const {
      return getBalance(getCurrentReceiver());
    }

    /// Aborts with kSysErrForbidden unless called by address
    outcome::result<void> validateImmediateCallerIs(
        const Address &address) const {
      return requireCondition(getImmediateCaller() == address,
                              VMExitCode::kSysErrForbidden);
    }
  };
}  // namespace fibon::vm::runtime
