/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <set>

#include <boost/optional.hpp>

#include "codec/cbor/cbor_token.hpp"
#include "codec/cbor/streams_annotation.hpp"
#include "common/outcome.hpp"

namespace fibon::codec::cbor {
  enum class CborDecodeError {
    kInvalidCbor = 1,
    kWrongType,
    kIntOverflow,
    kWrongSize,
    kTrailingBytes,
  };
}  // namespace fibon::codec::cbor

OUTCOME_HPP_DECLARE_ERROR(fibon::codec::cbor, CborDecodeError);

namespace fibon::codec::cbor {
  /** Decodes CBOR */
  class CborDecodeStream {
   public:
    static constexpr auto is_cbor_decoder_stream = true;

    explicit CborDecodeStream(BytesIn data);

    /** Decodes integer or bool */
    template <
        typename T,
        typename = std::enable_if_t<std::is_integral_v<T> || std::is_enum_v<T>>>
    CborDecodeStream &operator>>(T &num) {
      if constexpr (std::is_enum_v<T>) {
        std::underlying_type_t<T> value;
        *this >> value;
        num = static_cast<T>(value);
        return *this;
      } else {
        if constexpr (std::is_same_v<T, bool>) {
          num = _as(token_.asBool());
        } else if constexpr (std::is_unsigned_v<T>) {
          if (token_.type == CborToken::Type::INT) {
            outcome::raise(CborDecodeError::kIntOverflow);
          }
          const auto num64{_as(token_.asUint())};
          if (num64 > std::numeric_limits<T>::max()) {
            outcome::raise(CborDecodeError::kIntOverflow);
          }
          num = static_cast<T>(num64);
        } else {
          if (token_
              && (token_.type == CborToken::Type::UINT
                  || token_.type == CborToken::Type::INT)
              && !token_.asInt()) {
            outcome::raise(CborDecodeError::kIntOverflow);
          }
          const auto num64{_as(token_.asInt())};
          if (num64 > static_cast<int64_t>(std::numeric_limits<T>::max())
              || num64 < static_cast<int64_t>(std::numeric_limits<T>::min())) {
            outcome::raise(CborDecodeError::kIntOverflow);
          }
          num = static_cast<T>(num64);
        }
        next();
        return *this;
      }
    }

    /// Decodes nullable optional value
    template <typename T>
    CborDecodeStream &operator>>(boost::optional<T> &optional) {
      if (isNull()) {
        optional = boost::none;
        next();
      } else {
        T value{};
        *this >> value;
        optional = std::move(value);
      }
      return *this;
    }

    /// Decodes list elements into vector
    template <typename T>
    CborDecodeStream &operator>>(std::vector<T> &values) {
      const auto n{listLength()};
      auto l{list()};
      values.clear();
      values.reserve(n);
      for (size_t i{}; i < n; ++i) {
        T value{};
        l >> value;
        values.push_back(std::move(value));
      }
      return *this;
    }

    /// Decodes list elements into set, duplicates are rejected
    template <typename T>
    CborDecodeStream &operator>>(std::set<T> &values) {
      const auto n{listLength()};
      auto l{list()};
      values.clear();
      for (size_t i{}; i < n; ++i) {
        T value{};
        l >> value;
        if (!values.insert(std::move(value)).second) {
          outcome::raise(CborDecodeError::kInvalidCbor);
        }
      }
      return *this;
    }

    /// Decodes map items, duplicate keys are rejected
    template <typename K, typename V>
    CborDecodeStream &operator>>(std::map<K, V> &items) {
      const auto n{mapLength()};
      auto m{map()};
      items.clear();
      for (size_t i{}; i < n; ++i) {
        K key{};
        V value{};
        m >> key >> value;
        if (!items.emplace(std::move(key), std::move(value)).second) {
          outcome::raise(CborDecodeError::kInvalidCbor);
        }
      }
      return *this;
    }

    /** Decodes bytes */
    CborDecodeStream &operator>>(Bytes &bytes);
    /** Decodes string */
    CborDecodeStream &operator>>(std::string &str);
    /** Creates list container decode substream */
    CborDecodeStream list();
    /** Creates decode substream over map keys and values */
    CborDecodeStream map();
    /** Skips current element */
    void skip() {
      readNested();
    }
    /** Checks if current element is list container */
    bool isList() const {
      return (bool)token_.listCount();
    }
    /** Checks if current element is map container */
    bool isMap() const {
      return (bool)token_.mapCount();
    }
    bool isNull() const {
      return token_.isNull();
    }
    /** Checks if all elements were read */
    bool empty() const {
      return input_.empty();
    }

    /** Returns count of items in current element list container */
    size_t listLength() const {
      return _as(token_.listCount());
    }
    /** Returns count of key-value pairs in current element map container */
    size_t mapLength() const {
      return _as(token_.mapCount());
    }
    /** Reads CBOR bytes of current element (and advances to the next element)
     */
    Bytes raw() {
      return copy(readNested());
    }

    template <typename T>
    auto get() {
      T v{};
      *this >> v;
      return v;
    }

   private:
    template <typename T>
    T _as(const std::optional<T> &opt) const {
      if (!token_) {
        outcome::raise(CborDecodeError::kInvalidCbor);
      }
      if (!opt) {
        outcome::raise(CborDecodeError::kWrongType);
      }
      return *opt;
    }
    /// Moves to the token following current header and payload
    void next();
    void readToken();
    BytesIn readNested();

    /// Bytes starting at current token header
    BytesIn input_;
    /// Bytes following current token header
    BytesIn partial_;
    CborToken token_;
  };
}  // namespace fibon::codec::cbor
