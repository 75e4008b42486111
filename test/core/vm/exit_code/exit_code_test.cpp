/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "vm/exit_code/exit_code.hpp"

#include <gtest/gtest.h>

#include "common/error_text.hpp"
#include "testutil/outcome.hpp"

using fibon::outcome::result;
using fibon::vm::asAbort;
using fibon::vm::asExitCode;
using fibon::vm::catchAbort;
using fibon::vm::isAbortExitCode;
using fibon::vm::isVMExitCode;
using fibon::vm::requireNoError;
using fibon::vm::VMExitCode;

/**
 * @given Abort exit code
 * @when leaves actor method
 * @then converted to plain exit code, assert is reported as reserved code
 */
TEST(VMExitCode, CatchAbort) {
  const std::error_code abort{asAbort(VMExitCode::kErrForbidden)};
  EXPECT_TRUE(isAbortExitCode(abort));
  EXPECT_FALSE(isVMExitCode(abort));
  EXPECT_EQ(catchAbort(abort), VMExitCode::kErrForbidden);
  EXPECT_EQ(catchAbort(asAbort(VMExitCode::kAssert)),
            VMExitCode::kSysErrReserved1);

  const auto other{ERROR_TEXT("other")};
  EXPECT_EQ(catchAbort(other), other);
}

/// Only VMExitCode errors convert to exit code
TEST(VMExitCode, AsExitCode) {
  EXPECT_OUTCOME_EQ(asExitCode(result<int>{1}), VMExitCode::kOk);
  EXPECT_OUTCOME_EQ(
      asExitCode(result<int>{fibon::outcome::failure(
          VMExitCode::kErrNotFound)}),
      VMExitCode::kErrNotFound);
  EXPECT_FALSE(asExitCode(ERROR_TEXT("other")));
}

/**
 * @given Results with different errors
 * @when require no error with default
 * @then exit codes are kept, other errors are replaced by default
 */
TEST(VMExitCode, RequireNoError) {
  EXPECT_OUTCOME_TRUE_1(
      requireNoError(result<int>{1}, VMExitCode::kErrIllegalState));
  EXPECT_OUTCOME_ERROR(
      asAbort(VMExitCode::kErrNotFound),
      requireNoError(result<int>{fibon::outcome::failure(
                         VMExitCode::kErrNotFound)},
                     VMExitCode::kErrIllegalState));
  EXPECT_OUTCOME_ERROR(
      asAbort(VMExitCode::kErrIllegalState),
      requireNoError(
          result<int>{fibon::outcome::failure(ERROR_TEXT("other"))},
          VMExitCode::kErrIllegalState));
}
