/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <vector>

#include "codec/cbor/streams_annotation.hpp"
#include "common/bytes.hpp"
#include "primitives/address/address_codec.hpp"
#include "vm/exit_code/exit_code.hpp"
#include "vm/message/message.hpp"

namespace fibon::vm::runtime {
  using message::UnsignedMessage;
  using primitives::address::Address;

  using InvocationOutput = Bytes;

  /**
   * Event emitted by actor during message execution.
   * Events of reverted calls are discarded.
   */
  struct ActorEvent {
    /// Actor emitted the event
    Address emitter;
    /// Event type name
    std::string name;
    /// CBOR encoded event payload
    Bytes data;

    inline bool operator==(const ActorEvent &other) const {
      return emitter == other.emitter && name == other.name
             && data == other.data;
    }
  };
  CBOR_TUPLE(ActorEvent, emitter, name, data)

  /**
   * Result of message execution
   */
  struct MessageReceipt {
    VMExitCode exit_code{};
    Bytes return_value;
    /// Events in emission order
    std::vector<ActorEvent> events;
  };
  CBOR_TUPLE(MessageReceipt, exit_code, return_value, events)
}  // namespace fibon::vm::runtime
