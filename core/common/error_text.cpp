/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/error_text.hpp"

#include <mutex>
#include <vector>

namespace fibon::error_text {
  /// Messages are registered once and referenced by index, starting from 1
  class Category : public std::error_category {
   public:
    const char *name() const noexcept override {
      return "ErrorText";
    }

    std::string message(int value) const override {
      std::lock_guard lock{mutex_};
      if (value <= 0 || static_cast<size_t>(value) > messages_.size()) {
        return "Unknown error text";
      }
      return messages_[value - 1];
    }

    int add(const char *message) const {
      std::lock_guard lock{mutex_};
      messages_.emplace_back(message);
      return static_cast<int>(messages_.size());
    }

   private:
    mutable std::mutex mutex_;
    mutable std::vector<const char *> messages_;
  };

  const Category &category() {
    static const Category category;
    return category;
  }

  std::error_code _make_error_code(const char *message) {
    const auto &cat{category()};
    return {cat.add(message), cat};
  }
}  // namespace fibon::error_text
