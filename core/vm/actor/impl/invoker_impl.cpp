/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "vm/actor/impl/invoker_impl.hpp"

#include "vm/actor/builtin/multisig/multisig_actor.hpp"
#include "vm/actor/builtin/token/token_actor.hpp"
#include "vm/actor/builtin/vesting/vesting_actor.hpp"
#include "vm/actor/codes.hpp"

namespace fibon::vm::actor {

  InvokerImpl::InvokerImpl() {
    registerActor(builtin::kSystemCodeId, {});
    registerActor(builtin::kAccountCodeId, {});
    registerActor(builtin::kMultisigCodeId, builtin::multisig::exports);
    registerActor(builtin::kTokenCodeId, builtin::token::exports);
    registerActor(builtin::kVestingCodeId, builtin::vesting::exports);
  }

  void InvokerImpl::registerActor(const CodeId &code, ActorExports exports) {
    actors_[code] = std::move(exports);
  }

  outcome::result<InvocationOutput> InvokerImpl::invoke(const CodeId &code,
                                                        Runtime &runtime) {
    const auto actor{actors_.find(code)};
    if (actor == actors_.end()) {
      return VMExitCode::kSysErrIllegalActor;
    }
    const auto &message{runtime.getMessage()};
    const auto transfer{message.method == kSendMethodNumber};
    if (transfer && !message.params.empty()) {
      return VMExitCode::kSysErrInvalidMethod;
    }
    const auto method{actor->second.find(message.method)};
    if (method != actor->second.end()) {
      return method->second(runtime, message.params);
    }
    if (transfer) {
      return InvocationOutput{};
    }
    return VMExitCode::kSysErrInvalidMethod;
  }
}  // namespace fibon::vm::actor
