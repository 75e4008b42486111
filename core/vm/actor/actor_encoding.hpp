/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "codec/cbor/cbor_codec.hpp"
#include "common/outcome.hpp"
#include "vm/actor/actor.hpp"
#include "vm/exit_code/exit_code.hpp"
#include "vm/runtime/runtime_types.hpp"

namespace fibon::vm::actor {
  using runtime::ActorEvent;
  using runtime::InvocationOutput;

  /// Params or result of method without them, encoded as empty bytes
  struct None {};
  CBOR_ENCODE(None, none) {
    return s;
  }
  CBOR_DECODE(None, none) {
    return s;
  }

  template <typename T>
  constexpr bool kIsNone{std::is_same_v<T, None>};

  /// Malformed params are reported as kErrSerialization
  template <typename T>
  outcome::result<T> decodeActorParams(const MethodParams &params) {
    if constexpr (kIsNone<T>) {
      return T{};
    } else {
      auto decoded{codec::cbor::decode<T>(params)};
      if (!decoded) {
        return outcome::failure(VMExitCode::kErrSerialization);
      }
      return decoded;
    }
  }

  template <typename T>
  outcome::result<MethodParams> encodeActorParams(const T &params) {
    if constexpr (kIsNone<T>) {
      return MethodParams{};
    } else {
      auto encoded{codec::cbor::encode(params)};
      if (!encoded) {
        return outcome::failure(VMExitCode::kErrSerialization);
      }
      return encoded;
    }
  }

  template <typename T>
  outcome::result<T> decodeActorReturn(const InvocationOutput &output) {
    if constexpr (kIsNone<T>) {
      return T{};
    } else {
      return codec::cbor::decode<T>(output);
    }
  }

  template <typename T>
  outcome::result<InvocationOutput> encodeActorReturn(const T &result) {
    if constexpr (kIsNone<T>) {
      return InvocationOutput{};
    } else {
      auto encoded{codec::cbor::encode(result)};
      if (!encoded) {
        return outcome::failure(VMExitCode::kEncodeActorResultError);
      }
      return encoded;
    }
  }

  /// Decodes payload of event named E::kName
  template <typename E>
  outcome::result<E> decodeActorEvent(const ActorEvent &event) {
    if (event.name != E::kName) {
      return outcome::failure(VMExitCode::kErrSerialization);
    }
    return codec::cbor::decode<E>(event.data);
  }
}  // namespace fibon::vm::actor
