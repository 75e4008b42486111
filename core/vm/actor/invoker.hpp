/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "vm/actor/actor_method.hpp"

namespace fibon::vm::actor {
  using runtime::InvocationOutput;

  /**
   * Dispatches message of runtime to method exported by actor code.
   * Errors are exit codes of the invoked method or dispatch failure.
   */
  class Invoker {
   public:
    virtual ~Invoker() = default;

    virtual outcome::result<InvocationOutput> invoke(const CodeId &code,
                                                     Runtime &runtime) = 0;
  };
}  // namespace fibon::vm::actor
