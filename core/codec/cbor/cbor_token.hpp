/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <limits>

#include "codec/common.hpp"

namespace fibon::codec::cbor {
  constexpr uint8_t kExtraUint8{24};
  constexpr uint8_t kExtraUint16{25};
  constexpr uint8_t kExtraUint32{26};
  constexpr uint8_t kExtraUint64{27};

  constexpr uint64_t kExtraFalse{20};
  constexpr uint64_t kExtraTrue{21};
  constexpr uint64_t kExtraNull{22};

  /// CBOR major type with its argument (value, length or count)
  struct CborToken {
    enum Type : uint8_t {
      UINT,
      INT,
      BYTES,
      STR,
      LIST,
      MAP,
      TAG,
      SPECIAL,
      INVALID,
    };

    Type type{Type::INVALID};
    uint64_t extra{};

    constexpr operator bool() const {
      return type != Type::INVALID;
    }

    constexpr bool isNull() const {
      return type == Type::SPECIAL && extra == kExtraNull;
    }
    constexpr std::optional<bool> asBool() const {
      if (type == Type::SPECIAL && extra == kExtraFalse) {
        return false;
      }
      if (type == Type::SPECIAL && extra == kExtraTrue) {
        return true;
      }
      return {};
    }
    constexpr std::optional<uint64_t> asUint() const {
      if (type == Type::UINT) {
        return extra;
      }
      return {};
    }
    constexpr std::optional<int64_t> asInt() const {
      if (type == Type::UINT
          && extra <= static_cast<uint64_t>(
                 std::numeric_limits<int64_t>::max())) {
        return static_cast<int64_t>(extra);
      }
      if (type == Type::INT
          && extra <= static_cast<uint64_t>(
                 std::numeric_limits<int64_t>::max())) {
        return ~static_cast<int64_t>(extra);
      }
      return {};
    }
    constexpr std::optional<size_t> bytesSize() const {
      if (type == Type::BYTES) {
        return extra;
      }
      return {};
    }
    constexpr std::optional<size_t> strSize() const {
      if (type == Type::STR) {
        return extra;
      }
      return {};
    }
    constexpr std::optional<size_t> listCount() const {
      if (type == Type::LIST) {
        return extra;
      }
      return {};
    }
    constexpr std::optional<size_t> mapCount() const {
      if (type == Type::MAP) {
        return extra;
      }
      return {};
    }
    /// Size of payload following the header
    constexpr size_t anySize() const {
      return type == Type::BYTES || type == Type::STR ? extra : 0;
    }
    /// Count of nested items following the header
    constexpr uint64_t anyCount() const {
      switch (type) {
        case Type::LIST:
          return extra;
        case Type::MAP:
          return 2 * extra;
        case Type::TAG:
          return 1;
        default:
          return 0;
      }
    }
  };

  /**
   * Reads token header and advances input past it.
   * Indefinite lengths are not supported.
   * @return false if input is truncated or malformed
   */
  inline bool read(CborToken &token, BytesIn &input) {
    token = {};
    if (input.empty()) {
      return false;
    }
    const auto first{input[0]};
    const auto type{static_cast<CborToken::Type>(first >> 5)};
    const uint8_t info = first & 0x1F;
    input = input.subspan(1);
    uint64_t extra{};
    if (info < kExtraUint8) {
      extra = info;
    } else {
      size_t more{};
      switch (info) {
        case kExtraUint8:
          more = 1;
          break;
        case kExtraUint16:
          more = 2;
          break;
        case kExtraUint32:
          more = 4;
          break;
        case kExtraUint64:
          more = 8;
          break;
        default:
          return false;
      }
      BytesIn be;
      if (!codec::read(be, input, more)) {
        return false;
      }
      for (auto byte : be) {
        extra = (extra << 8) | byte;
      }
    }
    token.type = type;
    token.extra = extra;
    return true;
  }

  /**
   * Reads CBOR nested item into nested and advances input to the next item.
   * @param[out] nested - read nested bytes
   * @param input - cbor bytes to read
   * @return true on success, otherwise false
   */
  inline bool readNested(BytesIn &nested, BytesIn &input) {
    const auto begin{input};
    uint64_t pending{1};
    while (pending != 0) {
      CborToken token;
      if (!read(token, input) || !codec::read(input, token.anySize())) {
        nested = {};
        return false;
      }
      --pending;
      const auto count{token.anyCount()};
      if (count > static_cast<uint64_t>(input.size())) {
        // every nested item takes at least one byte
        nested = {};
        return false;
      }
      pending += count;
    }
    nested = begin.first(begin.size() - input.size());
    return true;
  }

  inline void writeToken(Bytes &out, CborToken::Type type, uint64_t extra) {
    const auto first{static_cast<uint8_t>(type << 5)};
    size_t more{};
    if (extra < kExtraUint8) {
      out.push_back(first | static_cast<uint8_t>(extra));
      return;
    }
    if (extra <= 0xFF) {
      out.push_back(first | kExtraUint8);
      more = 1;
    } else if (extra <= 0xFFFF) {
      out.push_back(first | kExtraUint16);
      more = 2;
    } else if (extra <= 0xFFFFFFFF) {
      out.push_back(first | kExtraUint32);
      more = 4;
    } else {
      out.push_back(first | kExtraUint64);
      more = 8;
    }
    while (more != 0) {
      --more;
      out.push_back(static_cast<uint8_t>(extra >> (8 * more)));
    }
  }

  inline void writeNull(Bytes &out) {
    writeToken(out, CborToken::Type::SPECIAL, kExtraNull);
  }
  inline void writeBool(Bytes &out, bool value) {
    writeToken(out, CborToken::Type::SPECIAL, value ? kExtraTrue : kExtraFalse);
  }
  inline void writeUint(Bytes &out, uint64_t value) {
    writeToken(out, CborToken::Type::UINT, value);
  }
  inline void writeInt(Bytes &out, int64_t value) {
    if (value < 0) {
      writeToken(out, CborToken::Type::INT, static_cast<uint64_t>(~value));
    } else {
      writeUint(out, value);
    }
  }
  inline void writeBytes(Bytes &out, size_t size) {
    writeToken(out, CborToken::Type::BYTES, size);
  }
  inline void writeStr(Bytes &out, size_t size) {
    writeToken(out, CborToken::Type::STR, size);
  }
  inline void writeList(Bytes &out, size_t count) {
    writeToken(out, CborToken::Type::LIST, count);
  }
  inline void writeMap(Bytes &out, size_t count) {
    writeToken(out, CborToken::Type::MAP, count);
  }
}  // namespace fibon::codec::cbor
