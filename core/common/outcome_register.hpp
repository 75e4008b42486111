/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <system_error>
#include <typeinfo>

namespace fibon::outcome_detail {
  /**
   * Error category for enum type T, one instance per enum.
   * Message text is provided by `toString` specialization created with
   * OUTCOME_CPP_DEFINE_CATEGORY.
   */
  template <typename T>
  class Category : public std::error_category {
   public:
    const char *name() const noexcept final {
      return typeid(T).name();
    }

    std::string message(int value) const final {
      return toString(static_cast<T>(value));
    }

    static std::string toString(T value);

    static const Category<T> &get() {
      static const Category<T> category;
      return category;
    }

   private:
    Category() = default;
  };
}  // namespace fibon::outcome_detail

/// Registers enum as error code enum, use in header at global scope
#define OUTCOME_HPP_DECLARE_ERROR(ns, Enum)          \
  namespace std {                                    \
    template <>                                      \
    struct is_error_code_enum<ns::Enum> : true_type {};  \
  }                                                  \
  namespace ns {                                     \
    std::error_code make_error_code(Enum e);         \
  }

/// Defines error category message function, use in source at global scope
#define OUTCOME_CPP_DEFINE_CATEGORY(ns, Enum, name)                  \
  template <>                                                        \
  std::string fibon::outcome_detail::Category<ns::Enum>::toString(  \
      ns::Enum);                                                     \
  namespace ns {                                                     \
    std::error_code make_error_code(Enum e) {                        \
      return {static_cast<int>(e),                                   \
              ::fibon::outcome_detail::Category<Enum>::get()};       \
    }                                                                \
  }                                                                  \
  template <>                                                        \
  std::string fibon::outcome_detail::Category<ns::Enum>::toString(  \
      ns::Enum name)
