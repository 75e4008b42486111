/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/outcome/result.hpp>
#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>
#include <boost/throw_exception.hpp>

#include "common/outcome_register.hpp"

/// Returns error of result, or declares variable with its value
#define OUTCOME_TRY(...) BOOST_OUTCOME_TRY(__VA_ARGS__)

// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _OUTCOME_TRYA(var, val, ...) \
  OUTCOME_TRY(var, __VA_ARGS__);     \
  val = std::move(var);
/// Assigns value of result to existing variable or returns error
#define OUTCOME_TRYA(val, ...) \
  _OUTCOME_TRYA(BOOST_OUTCOME_TRY_UNIQUE_NAME, val, __VA_ARGS__)

namespace fibon::outcome {
  using BOOST_OUTCOME_V2_NAMESPACE::failure;
  using BOOST_OUTCOME_V2_NAMESPACE::success;

  template <typename T>
  using result = BOOST_OUTCOME_V2_NAMESPACE::result<T, std::error_code>;

  /// Throws error as std::system_error, used by codec streams
  [[noreturn]] inline void raise(const std::error_code &ec) {
    boost::throw_exception(std::system_error(ec));
  }

  template <typename T,
            typename = std::enable_if_t<std::is_error_code_enum_v<T>>>
  [[noreturn]] inline void raise(T t) {
    raise(make_error_code(t));
  }
}  // namespace fibon::outcome
