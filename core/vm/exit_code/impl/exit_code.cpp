/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "vm/exit_code/exit_code.hpp"

#include <spdlog/fmt/fmt.h>

namespace fibon::vm {
  namespace {
    std::string exitCodeName(VMExitCode code) {
      switch (code) {
        case VMExitCode::kOk:
          return "Ok";
        case VMExitCode::kFatal:
          return "Fatal";
        case VMExitCode::kAssert:
          return "Assert";
        case VMExitCode::kSysErrSenderInvalid:
          return "SysErrSenderInvalid";
        case VMExitCode::kSysErrInvalidMethod:
          return "SysErrInvalidMethod";
        case VMExitCode::kSysErrInvalidReceiver:
          return "SysErrInvalidReceiver";
        case VMExitCode::kSysErrInsufficientFunds:
          return "SysErrInsufficientFunds";
        case VMExitCode::kSysErrForbidden:
          return "SysErrForbidden";
        case VMExitCode::kSysErrIllegalActor:
          return "SysErrIllegalActor";
        case VMExitCode::kErrIllegalArgument:
          return "ErrIllegalArgument";
        case VMExitCode::kErrNotFound:
          return "ErrNotFound";
        case VMExitCode::kErrForbidden:
          return "ErrForbidden";
        case VMExitCode::kErrInsufficientFunds:
          return "ErrInsufficientFunds";
        case VMExitCode::kErrIllegalState:
          return "ErrIllegalState";
        case VMExitCode::kErrSerialization:
          return "ErrSerialization";
        case VMExitCode::kErrBalanceInvariantBroken:
          return "ErrBalanceInvariantBroken";
        default:
          return "";
      }
    }

    std::string describe(const char *kind, int64_t value) {
      const auto name{exitCodeName(static_cast<VMExitCode>(value))};
      if (name.empty()) {
        return fmt::format("{} {}", kind, value);
      }
      return fmt::format("{} {} ({})", kind, value, name);
    }
  }  // namespace
}  // namespace fibon::vm

OUTCOME_CPP_DEFINE_CATEGORY(fibon::vm, VMExitCode, e) {
  return fibon::vm::describe("VMExitCode", static_cast<int64_t>(e));
}

OUTCOME_CPP_DEFINE_CATEGORY(fibon::vm, VMFatal, e) {
  return "VMFatal: fatal vm error";
}

OUTCOME_CPP_DEFINE_CATEGORY(fibon::vm, VMAbortExitCode, e) {
  return fibon::vm::describe("VMAbortExitCode", static_cast<int64_t>(e));
}

namespace fibon::vm {
  namespace {
    template <typename T>
    bool hasCategory(const std::error_code &error) {
      return error.category() == outcome_detail::Category<T>::get();
    }
  }  // namespace

  bool isVMExitCode(const std::error_code &error) {
    return hasCategory<VMExitCode>(error);
  }

  bool isFatal(const std::error_code &error) {
    return hasCategory<VMFatal>(error);
  }

  bool isAbortExitCode(const std::error_code &error) {
    return hasCategory<VMAbortExitCode>(error);
  }

  outcome::result<VMExitCode> asExitCode(const std::error_code &error) {
    if (!isVMExitCode(error)) {
      return outcome::failure(error);
    }
    return outcome::success(static_cast<VMExitCode>(error.value()));
  }

  std::error_code catchAbort(const std::error_code &error) {
    if (!isAbortExitCode(error)) {
      return error;
    }
    const auto code{static_cast<VMExitCode>(error.value())};
    // failed assert leaves actor as reserved system code
    return code == VMExitCode::kAssert ? VMExitCode::kSysErrReserved1 : code;
  }
}  // namespace fibon::vm
