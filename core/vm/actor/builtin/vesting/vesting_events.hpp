/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include "codec/cbor/streams_annotation.hpp"
#include "primitives/address/address_codec.hpp"
#include "vm/actor/builtin/vesting/vesting_types.hpp"

namespace fibon::vm::actor::builtin::vesting {
  using primitives::address::Address;

  struct VestingTypeAddedEvent {
    static constexpr std::string_view kName{"VestingTypeAdded"};
    VestingTypeId type_id{};
  };
  CBOR_TUPLE(VestingTypeAddedEvent, type_id)

  struct VestingScheduleCreatedEvent {
    static constexpr std::string_view kName{"VestingScheduleCreated"};
    Address beneficiary;
    VestingTypeId type_id{};
    TokenAmount amount;
    UnixTime start_time{};
  };
  CBOR_TUPLE(VestingScheduleCreatedEvent,
             beneficiary,
             type_id,
             amount,
             start_time)

  struct TokensReleasedEvent {
    static constexpr std::string_view kName{"TokensReleased"};
    Address beneficiary;
    TokenAmount amount;
  };
  CBOR_TUPLE(TokensReleasedEvent, beneficiary, amount)

  /// Schedule deleted, unreleased tokens returned to owner
  struct BeneficiaryRevokedEvent {
    static constexpr std::string_view kName{"BeneficiaryRevoked"};
    Address beneficiary;
    TokenAmount returned;
  };
  CBOR_TUPLE(BeneficiaryRevokedEvent, beneficiary, returned)

  /// Vested part paid out, unvested part forfeited
  struct VestingScheduleDisabledEvent {
    static constexpr std::string_view kName{"VestingScheduleDisabled"};
    Address beneficiary;
    TokenAmount paid;
    TokenAmount forfeited;
  };
  CBOR_TUPLE(VestingScheduleDisabledEvent, beneficiary, paid, forfeited)

  struct TokenRecoveredEvent {
    static constexpr std::string_view kName{"TokenRecovered"};
    Address token;
    TokenAmount amount;
  };
  CBOR_TUPLE(TokenRecoveredEvent, token, amount)

}  // namespace fibon::vm::actor::builtin::vesting
