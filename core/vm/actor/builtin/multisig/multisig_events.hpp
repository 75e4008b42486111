/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include "codec/cbor/streams_annotation.hpp"
#include "primitives/address/address_codec.hpp"
#include "primitives/big_int.hpp"
#include "vm/actor/builtin/multisig/transaction.hpp"
#include "vm/exit_code/exit_code.hpp"

namespace fibon::vm::actor::builtin::multisig {

  /// Transaction was created
  struct SubmissionEvent {
    static constexpr std::string_view kName{"Submission"};
    TransactionId tx_id{};
  };
  CBOR_TUPLE(SubmissionEvent, tx_id)

  /// Owner approved transaction
  struct ConfirmationEvent {
    static constexpr std::string_view kName{"Confirmation"};
    Address sender;
    TransactionId tx_id{};
  };
  CBOR_TUPLE(ConfirmationEvent, sender, tx_id)

  /// Forwarded call succeeded
  struct ExecutionEvent {
    static constexpr std::string_view kName{"Execution"};
    TransactionId tx_id{};
  };
  CBOR_TUPLE(ExecutionEvent, tx_id)

  /// Forwarded call failed, transaction stays not executed
  struct ExecutionFailureEvent {
    static constexpr std::string_view kName{"ExecutionFailure"};
    TransactionId tx_id{};
    VMExitCode code{};
  };
  CBOR_TUPLE(ExecutionFailureEvent, tx_id, code)

  /// Plain transfer received
  struct DepositEvent {
    static constexpr std::string_view kName{"Deposit"};
    Address sender;
    TokenAmount value;
  };
  CBOR_TUPLE(DepositEvent, sender, value)

}  // namespace fibon::vm::actor::builtin::multisig
