/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/address/address_codec.hpp"

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/lexical_cast/try_lexical_convert.hpp>

namespace fibon::primitives::address {
  std::string encodeToString(const Address &address) {
    return kAddressPrefix + std::to_string(address.getId());
  }

  outcome::result<Address> decodeFromString(const std::string &s) {
    if (s.empty() || s.front() != kAddressPrefix) {
      return AddressError::kInvalidPrefix;
    }
    namespace algo = boost::algorithm;
    const auto digits{s.substr(1)};
    ActorId id{};
    if (digits.empty() || !algo::all(digits, algo::is_digit())
        || !boost::conversion::try_lexical_convert(digits, id)) {
      return AddressError::kInvalidPayload;
    }
    return Address{id};
  }
}  // namespace fibon::primitives::address
