/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/cbor/cbor_encode_stream.hpp"

#include "common/span.hpp"

namespace fibon::codec::cbor {
  Bytes &CborEncodeStream::item() {
    ++count_;
    return data_;
  }

  CborEncodeStream &CborEncodeStream::operator<<(const Bytes &bytes) {
    return *this << BytesIn{bytes};
  }

  CborEncodeStream &CborEncodeStream::operator<<(BytesIn bytes) {
    auto &out{item()};
    writeBytes(out, bytes.size());
    append(out, bytes);
    return *this;
  }

  CborEncodeStream &CborEncodeStream::operator<<(std::string_view str) {
    auto &out{item()};
    writeStr(out, str.size());
    append(out, common::span::cbytes(str));
    return *this;
  }

  CborEncodeStream &CborEncodeStream::operator<<(const std::string &str) {
    return *this << std::string_view{str};
  }

  CborEncodeStream &CborEncodeStream::operator<<(
      const CborEncodeStream &other) {
    if (other.is_list_) {
      writeList(item(), other.count_);
    } else {
      count_ += other.count_;
    }
    append(data_, other.data_);
    return *this;
  }

  CborEncodeStream &CborEncodeStream::operator<<(std::nullptr_t) {
    writeNull(item());
    return *this;
  }

  Bytes CborEncodeStream::data() const {
    if (!is_list_) {
      return data_;
    }
    Bytes out;
    writeList(out, count_);
    append(out, data_);
    return out;
  }

  size_t CborEncodeStream::count() const {
    return count_;
  }

  CborEncodeStream CborEncodeStream::list() {
    CborEncodeStream stream;
    stream.is_list_ = true;
    return stream;
  }
}  // namespace fibon::codec::cbor
