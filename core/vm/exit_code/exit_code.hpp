/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

/// Stops actor method with exit code that is not replaced by callers
#define ABORT(err_code) return outcome::failure(asAbort(err_code))

/// Aborts with err_code unless condition holds
#define REQUIRE(condition, err_code) \
  OUTCOME_TRY(requireCondition((condition), (err_code)))

#define VM_ASSERT(condition) REQUIRE(condition, VMExitCode::kAssert)

#define VALIDATE_ARG(condition) \
  REQUIRE(condition, VMExitCode::kErrIllegalArgument)

#define REQUIRE_STATE(condition) \
  REQUIRE(condition, VMExitCode::kErrIllegalState)

#define REQUIRE_FOUND(condition) REQUIRE(condition, VMExitCode::kErrNotFound)

#define REQUIRE_FUNDS(condition) \
  REQUIRE(condition, VMExitCode::kErrInsufficientFunds)

/**
 * Propagates error of expr as abort. Exit codes keep their value, other
 * errors are replaced by err_code. Aborts and fatal errors pass unchanged.
 */
#define REQUIRE_NO_ERROR(expr, err_code) \
  OUTCOME_TRY(requireNoError((expr), (err_code)))

#define REQUIRE_NO_ERROR_A(res, expr, err_code) \
  OUTCOME_TRY(res, requireNoErrorAssign((expr), (err_code)))

/// Like REQUIRE_NO_ERROR, but errors other than exit codes pass unchanged
#define REQUIRE_SUCCESS(expr) OUTCOME_TRY(requireSuccess((expr)))

#define REQUIRE_SUCCESS_A(res, expr) \
  OUTCOME_TRY(res, requireSuccessAssign((expr)))

namespace fibon::vm {
  /**
   * Result of message application and error of actor method.
   * Codes below 16 are reported by the VM itself, codes from 16 by actors.
   */
  enum class VMExitCode : int64_t {
    /// Failed VM_ASSERT, never leaves the VM as is
    kAssert = -2,
    kFatal = -1,

    kOk = 0,

    kSysErrSenderInvalid = 1,
    kSysErrInvalidMethod = 3,
    kSysErrReserved1 = 4,
    kSysErrInvalidReceiver = 5,
    kSysErrInsufficientFunds = 6,
    kSysErrForbidden = 8,
    kSysErrIllegalActor = 9,

    kErrIllegalArgument = 16,
    kErrNotFound = 17,
    kErrForbidden = 18,
    kErrInsufficientFunds = 19,
    kErrIllegalState = 20,
    kErrSerialization = 21,

    /// Vesting accounting no longer adds up
    kErrBalanceInvariantBroken = 1000,

    kEncodeActorResultError,
  };

  /// Error that stops message application entirely
  enum class VMFatal : int64_t {
    kFatal = 1,
  };

  /// VMExitCode raised by ABORT, callers pass it through unchanged
  enum class VMAbortExitCode : int64_t {};

  bool isVMExitCode(const std::error_code &error);

  bool isFatal(const std::error_code &error);

  bool isAbortExitCode(const std::error_code &error);

  /// Exit code carried by error, or the error itself if it is not exit code
  outcome::result<VMExitCode> asExitCode(const std::error_code &error);

  /// Turns abort back into plain exit code at method boundary
  std::error_code catchAbort(const std::error_code &error);
}  // namespace fibon::vm

OUTCOME_HPP_DECLARE_ERROR(fibon::vm, VMExitCode);

OUTCOME_HPP_DECLARE_ERROR(fibon::vm, VMFatal);

OUTCOME_HPP_DECLARE_ERROR(fibon::vm, VMAbortExitCode);

namespace fibon::vm {
  inline VMAbortExitCode asAbort(VMExitCode code) {
    return static_cast<VMAbortExitCode>(code);
  }

  inline outcome::result<void> requireCondition(bool condition,
                                                VMExitCode code) {
    if (!condition) {
      ABORT(code);
    }
    return outcome::success();
  }

  template <typename T>
  void catchAbort(outcome::result<T> &result) {
    if (result.has_error()) {
      result = catchAbort(result.error());
    }
  }

  template <typename T>
  outcome::result<VMExitCode> asExitCode(const outcome::result<T> &result) {
    if (result.has_value()) {
      return outcome::success(VMExitCode::kOk);
    }
    return asExitCode(result.error());
  }

  template <typename T>
  outcome::result<void> requireNoError(const outcome::result<T> &res,
                                       VMExitCode default_error) {
    if (res.has_value()) {
      return outcome::success();
    }
    const auto &error{res.error()};
    if (isFatal(error) || isAbortExitCode(error)) {
      return error;
    }
    const auto code{asExitCode(error)};
    ABORT(code ? code.value() : default_error);
  }

  template <typename T>
  outcome::result<T> requireNoErrorAssign(outcome::result<T> &&res,
                                          VMExitCode default_error) {
    REQUIRE_NO_ERROR(res, default_error);
    return std::move(res);
  }

  template <typename T>
  outcome::result<void> requireSuccess(const outcome::result<T> &res) {
    if (res.has_value()) {
      return outcome::success();
    }
    if (const auto code{asExitCode(res.error())}) {
      ABORT(code.value());
    }
    return res.error();
  }

  template <typename T>
  outcome::result<T> requireSuccessAssign(outcome::result<T> &&res) {
    REQUIRE_SUCCESS(res);
    return std::move(res);
  }
}  // namespace fibon::vm
