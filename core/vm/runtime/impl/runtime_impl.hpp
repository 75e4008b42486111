/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "vm/runtime/env.hpp"
#include "vm/runtime/runtime.hpp"

namespace fibon::vm::runtime {

  /// Runtime of message invoked within execution
  class RuntimeImpl : public Runtime {
   public:
    RuntimeImpl(std::shared_ptr<Execution> execution, UnsignedMessage message);

    UnixTime getCurrentTime() const override;
    Address getImmediateCaller() const override;
    Address getCurrentReceiver() const override;
    outcome::result<TokenAmount> getBalance(
        const Address &address) const override;
    TokenAmount getValueReceived() const override;
    outcome::result<InvocationOutput> send(const Address &to_address,
                                           MethodNumber method_number,
                                           MethodParams params,
                                           const TokenAmount &value) override;
    const UnsignedMessage &getMessage() const override;
    outcome::result<Bytes> getActorHead() const override;
    outcome::result<void> commit(const Bytes &new_state) override;
    outcome::result<void> emitEvent(std::string_view name,
                                    const Bytes &data) override;

   private:
    outcome::result<Actor> receiverActor() const;

    std::shared_ptr<Execution> execution_;
    UnsignedMessage message_;
  };

}  // namespace fibon::vm::runtime
