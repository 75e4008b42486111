/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <map>

#include "common/outcome.hpp"
#include "vm/actor/actor.hpp"
#include "vm/actor/actor_encoding.hpp"
#include "vm/exit_code/exit_code.hpp"
#include "vm/runtime/runtime.hpp"

#define ACTOR_METHOD_DECL() \
  static outcome::result<Result> call(Runtime &, const Params &);

#define ACTOR_METHOD_IMPL(M) \
  outcome::result<M::Result> M::call(Runtime &runtime, const Params &params)

namespace fibon::vm::actor {
  using runtime::InvocationOutput;
  using runtime::Runtime;

  /// Decodes params, calls method and encodes its result
  using ActorMethod = std::function<outcome::result<InvocationOutput>(
      Runtime &, const MethodParams &)>;

  using ActorExports = std::map<MethodNumber, ActorMethod>;

  /**
   * Base of method description: number, Params, Result and static call.
   * Methods without params or result keep None.
   */
  template <uint64_t number>
  struct ActorMethodBase {
    using Params = None;
    using Result = None;
    static constexpr MethodNumber Number{number};
  };

  template <typename M>
  outcome::result<InvocationOutput> callEncoded(Runtime &runtime,
                                                const MethodParams &encoded) {
    OUTCOME_TRY(params, decodeActorParams<typename M::Params>(encoded));
    OUTCOME_TRY(result, M::call(runtime, params));
    return encodeActorReturn(result);
  }

  /// Export table entry of method M
  template <typename M>
  std::pair<MethodNumber, ActorMethod> exportMethod() {
    return {M::Number, &callEncoded<M>};
  }
}  // namespace fibon::vm::actor
