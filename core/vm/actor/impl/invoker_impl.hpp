/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "vm/actor/invoker.hpp"

namespace fibon::vm::actor {

  /// Invoker of builtin actors: system, account, multisig, token and vesting
  class InvokerImpl : public Invoker {
   public:
    InvokerImpl();

    /**
     * Method 0 without params is a plain transfer, it succeeds on actors not
     * exporting it.
     */
    outcome::result<InvocationOutput> invoke(const CodeId &code,
                                             Runtime &runtime) override;

    /// Adds or replaces methods of code
    void registerActor(const CodeId &code, ActorExports exports);

   private:
    std::map<CodeId, ActorExports> actors_;
  };
}  // namespace fibon::vm::actor
