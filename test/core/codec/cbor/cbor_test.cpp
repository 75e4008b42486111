/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/cbor/cbor_codec.hpp"

#include <gtest/gtest.h>

#include "primitives/address/address_codec.hpp"
#include "primitives/big_int.hpp"
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"

using fibon::codec::cbor::CborDecodeError;
using fibon::codec::cbor::CborDecodeStream;
using fibon::codec::cbor::decode;
using fibon::codec::cbor::encode;
using fibon::primitives::BigInt;
using fibon::primitives::address::Address;

namespace fibon::codec::cbor {
  struct Sample {
    Address address;
    BigInt amount;
    boost::optional<int64_t> time;

    bool operator==(const Sample &other) const {
      return address == other.address && amount == other.amount
             && time == other.time;
    }
  };
  CBOR_TUPLE(Sample, address, amount, time)
}  // namespace fibon::codec::cbor

using fibon::codec::cbor::Sample;

/**
 * @given Element or CBOR
 * @when encode decode
 * @then As expected
 */
TEST(Cbor, EncodeDecode) {
  EXPECT_OUTCOME_EQ(encode(1), "01"_unhex);
  EXPECT_OUTCOME_EQ(decode<int>("01"_unhex), 1);
  EXPECT_OUTCOME_ERROR(CborDecodeError::kWrongType, decode<int>("80"_unhex));
}

/** BigInt CBOR encoding and decoding */
TEST(Cbor, BigInt) {
  EXPECT_OUTCOME_EQ(encode(BigInt(0xCAFE)), "4300CAFE"_unhex);
  EXPECT_OUTCOME_EQ(decode<BigInt>("4300CAFE"_unhex), 0xCAFE);
  EXPECT_OUTCOME_EQ(encode(BigInt(-0xCAFE)), "4301CAFE"_unhex);
  EXPECT_OUTCOME_EQ(decode<BigInt>("4301CAFE"_unhex), -0xCAFE);
  EXPECT_OUTCOME_EQ(encode(BigInt(0)), "40"_unhex);
  EXPECT_OUTCOME_EQ(decode<BigInt>("40"_unhex), 0);
}

/** Optional CBOR encoding and decoding */
TEST(Cbor, Optional) {
  boost::optional<int> empty;
  EXPECT_OUTCOME_EQ(encode(empty), "F6"_unhex);
  EXPECT_OUTCOME_EQ(decode<boost::optional<int>>("F6"_unhex), empty);
  EXPECT_OUTCOME_EQ(encode(boost::make_optional(3)), "03"_unhex);
  EXPECT_OUTCOME_EQ(decode<boost::optional<int>>("03"_unhex), 3);
  EXPECT_TRUE(CborDecodeStream("F6"_unhex).isNull());
}

/// Vector CBOR encoding and decoding
TEST(Cbor, Vector) {
  std::vector<int> a{2, 5, 9};
  EXPECT_OUTCOME_EQ(encode(a), "83020509"_unhex);
  EXPECT_OUTCOME_EQ(decode<std::vector<int>>("83020509"_unhex), a);
}

/// Map CBOR encoding is ordered by key
TEST(Cbor, Map) {
  std::map<std::string, int> m;
  m["three"] = 3;
  m["one"] = 1;
  m["two"] = 2;
  EXPECT_OUTCOME_EQ(encode(m), "A3636F6E65016374776F0265746872656503"_unhex);
  EXPECT_OUTCOME_EQ((decode<std::map<std::string, int>>(
                        "A3636F6E65016374776F0265746872656503"_unhex)),
                    m);
}

/**
 * @given CBOR list with repeated element
 * @when decode as set
 * @then error, set elements are unique
 */
TEST(Cbor, SetRejectsDuplicates) {
  EXPECT_OUTCOME_EQ(decode<std::set<int>>("820102"_unhex),
                    (std::set<int>{1, 2}));
  EXPECT_OUTCOME_ERROR(CborDecodeError::kInvalidCbor,
                       decode<std::set<int>>("820101"_unhex));
}

/**
 * @given Integers and bool
 * @when Encode
 * @then Encoded as expected
 */
TEST(CborEncoder, Integral) {
  EXPECT_OUTCOME_EQ(encode(0ull), "00"_unhex);
  EXPECT_OUTCOME_EQ(encode(23), "17"_unhex);
  EXPECT_OUTCOME_EQ(encode(24), "1818"_unhex);
  EXPECT_OUTCOME_EQ(encode(-1), "20"_unhex);
  EXPECT_OUTCOME_EQ(encode(false), "F4"_unhex);
  EXPECT_OUTCOME_EQ(encode(true), "F5"_unhex);
}

/**
 * @given Negative integer
 * @when decode as unsigned
 * @then overflow error
 */
TEST(CborDecoder, NegativeAsUnsigned) {
  EXPECT_OUTCOME_ERROR(CborDecodeError::kIntOverflow,
                       decode<uint64_t>("20"_unhex));
  EXPECT_OUTCOME_ERROR(CborDecodeError::kIntOverflow,
                       decode<uint8_t>("190100"_unhex));
}

/**
 * @given One encoded item followed by more bytes
 * @when decode
 * @then trailing bytes error
 */
TEST(CborDecoder, TrailingBytes) {
  EXPECT_OUTCOME_ERROR(CborDecodeError::kTrailingBytes,
                       decode<int>("0101"_unhex));
}

/**
 * @given Struct annotated as tuple
 * @when encode
 * @then encoded as list of fields, decoded back equal
 */
TEST(Cbor, Tuple) {
  const Sample sample{Address::makeFromId(100), 5, boost::none};
  EXPECT_OUTCOME_EQ(encode(sample), "831864420005F6"_unhex);
  EXPECT_OUTCOME_EQ(decode<Sample>("831864420005F6"_unhex), sample);
}
