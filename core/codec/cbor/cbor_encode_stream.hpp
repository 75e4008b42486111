/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <set>
#include <string_view>

#include <boost/optional.hpp>

#include "codec/cbor/cbor_token.hpp"
#include "codec/cbor/streams_annotation.hpp"

namespace fibon::codec::cbor {
  /** Encodes CBOR */
  class CborEncodeStream {
   public:
    static constexpr auto is_cbor_encoder_stream = true;

    /** Encodes integer or bool */
    template <
        typename T,
        typename = std::enable_if_t<std::is_integral_v<T> || std::is_enum_v<T>>>
    CborEncodeStream &operator<<(T num) {
      if constexpr (std::is_enum_v<T>) {
        return *this << static_cast<std::underlying_type_t<T>>(num);
      } else {
        if constexpr (std::is_same_v<T, bool>) {
          writeBool(item(), num);
        } else if constexpr (std::is_unsigned_v<T>) {
          writeUint(item(), num);
        } else {
          writeInt(item(), num);
        }
      }
      return *this;
    }

    /// Encodes nullable optional value
    template <typename T>
    CborEncodeStream &operator<<(const boost::optional<T> &optional) {
      if (optional) {
        *this << *optional;
      } else {
        *this << nullptr;
      }
      return *this;
    }

    /// Encodes elements into list
    template <typename T>
    CborEncodeStream &operator<<(const gsl::span<T> &values) {
      return writeItems(values, values.size());
    }

    /// Encodes vector into list
    template <typename T>
    CborEncodeStream &operator<<(const std::vector<T> &values) {
      return *this << gsl::make_span(values);
    }

    /// Encodes set into list, elements in ascending order
    template <typename T>
    CborEncodeStream &operator<<(const std::set<T> &values) {
      return writeItems(values, values.size());
    }

    /// Encodes map with keys in ascending order
    template <typename K, typename V>
    CborEncodeStream &operator<<(const std::map<K, V> &items) {
      writeMap(item(), items.size());
      const auto count{count_};
      for (const auto &[key, value] : items) {
        *this << key << value;
      }
      count_ = count;
      return *this;
    }

    CborEncodeStream &operator<<(const Bytes &bytes);
    CborEncodeStream &operator<<(BytesIn bytes);
    CborEncodeStream &operator<<(std::string_view str);
    CborEncodeStream &operator<<(const std::string &str);
    /// Appends items of other stream, list stream is appended as one item
    CborEncodeStream &operator<<(const CborEncodeStream &other);
    CborEncodeStream &operator<<(std::nullptr_t);

    /// CBOR of encoded items, list header included for list stream
    Bytes data() const;
    size_t count() const;

    /// Stream whose items form one CBOR list
    static CborEncodeStream list();

   private:
    /// Counts one more item, returns buffer to write it to
    Bytes &item();

    template <typename Container>
    CborEncodeStream &writeItems(const Container &values, size_t size) {
      writeList(item(), size);
      const auto count{count_};
      for (const auto &value : values) {
        *this << value;
      }
      count_ = count;
      return *this;
    }

    bool is_list_{false};
    Bytes data_{};
    size_t count_{0};
  };
}  // namespace fibon::codec::cbor
