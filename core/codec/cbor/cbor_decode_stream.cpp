/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/cbor/cbor_decode_stream.hpp"

#include "common/span.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(fibon::codec::cbor, CborDecodeError, e) {
  using E = fibon::codec::cbor::CborDecodeError;
  switch (e) {
    case E::kInvalidCbor:
      return "CborDecodeError: malformed item";
    case E::kWrongType:
      return "CborDecodeError: item of unexpected type";
    case E::kIntOverflow:
      return "CborDecodeError: integer out of range";
    case E::kWrongSize:
      return "CborDecodeError: unexpected number of items";
    case E::kTrailingBytes:
      return "CborDecodeError: bytes left after item";
  }
  return "CborDecodeError: unknown";
}

namespace fibon::codec::cbor {
  CborDecodeStream::CborDecodeStream(BytesIn data) : partial_{data} {
    readToken();
  }

  CborDecodeStream &CborDecodeStream::operator>>(Bytes &bytes) {
    BytesIn payload;
    if (!codec::read(payload, partial_, _as(token_.bytesSize()))) {
      outcome::raise(CborDecodeError::kInvalidCbor);
    }
    copy(bytes, payload);
    readToken();
    return *this;
  }

  CborDecodeStream &CborDecodeStream::operator>>(std::string &str) {
    BytesIn payload;
    if (!codec::read(payload, partial_, _as(token_.strSize()))) {
      outcome::raise(CborDecodeError::kInvalidCbor);
    }
    str = common::span::bytestr(payload);
    readToken();
    return *this;
  }

  CborDecodeStream CborDecodeStream::list() {
    listLength();
    auto nested{readNested()};
    CborToken header;
    read(header, nested);
    return CborDecodeStream{nested};
  }

  CborDecodeStream CborDecodeStream::map() {
    mapLength();
    auto nested{readNested()};
    CborToken header;
    read(header, nested);
    return CborDecodeStream{nested};
  }

  void CborDecodeStream::next() {
    if (!codec::read(partial_, token_.anySize())) {
      outcome::raise(CborDecodeError::kInvalidCbor);
    }
    readToken();
  }

  void CborDecodeStream::readToken() {
    input_ = partial_;
    token_ = {};
    if (!partial_.empty() && !read(token_, partial_)) {
      outcome::raise(CborDecodeError::kInvalidCbor);
    }
  }

  BytesIn CborDecodeStream::readNested() {
    if (!token_) {
      outcome::raise(CborDecodeError::kInvalidCbor);
    }
    BytesIn nested;
    if (!cbor::readNested(nested, input_)) {
      outcome::raise(CborDecodeError::kInvalidCbor);
    }
    partial_ = input_;
    readToken();
    return nested;
  }
}  // namespace fibon::codec::cbor
