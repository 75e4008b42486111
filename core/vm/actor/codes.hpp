/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "vm/actor/code.hpp"

namespace fibon::vm::actor::builtin {
  constexpr ActorCodeCid kSystemCodeId{"fibon/1/system"};
  constexpr ActorCodeCid kAccountCodeId{"fibon/1/account"};
  constexpr ActorCodeCid kMultisigCodeId{"fibon/1/multisig"};
  constexpr ActorCodeCid kTokenCodeId{"fibon/1/token"};
  constexpr ActorCodeCid kVestingCodeId{"fibon/1/vesting"};
}  // namespace fibon::vm::actor::builtin
