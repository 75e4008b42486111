/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "vm/actor/builtin/vesting/vesting_math.hpp"

#include <gtest/gtest.h>
#include <limits>

#include "testutil/outcome.hpp"

using fibon::primitives::TokenAmount;
using fibon::primitives::UnixTime;
using fibon::vm::VMExitCode;
using namespace fibon::vm::actor::builtin::vesting;

constexpr UnixTime kDay{86400};
constexpr UnixTime kStart{1577836800};

/// 30% over first 30 days, 70% over next 30 days
const VestingPhases kTwoPhases{{0, 30 * kDay, 30}, {30 * kDay, 60 * kDay, 70}};

class VestingMathTest : public testing::Test {
 public:
  VestingSchedule schedule{kStart, 10000, 0, kTwoPhases, false};
};

/**
 * @given Allocation 10000 with two phases
 * @when 15 days into second phase
 * @then 3000 of first phase and 3500 of second phase are vested
 */
TEST_F(VestingMathTest, VestedMidSecondPhase) {
  EXPECT_OUTCOME_EQ(vestedAmount(schedule, kStart + 45 * kDay),
                    TokenAmount{6500});
  EXPECT_OUTCOME_EQ(releasableAmount(schedule, kStart + 45 * kDay),
                    TokenAmount{6500});
  EXPECT_OUTCOME_EQ(vestedPercentage(schedule, kStart + 45 * kDay),
                    uint64_t{6500});

  schedule.released = 6500;
  EXPECT_OUTCOME_EQ(releasableAmount(schedule, kStart + 45 * kDay),
                    TokenAmount{0});
}

/**
 * @given Schedule
 * @when before start, at boundaries and after last phase
 * @then nothing, exact phase sums and full allocation are vested
 */
TEST_F(VestingMathTest, Boundaries) {
  EXPECT_OUTCOME_EQ(vestedAmount(schedule, kStart - 1), TokenAmount{0});
  EXPECT_OUTCOME_EQ(vestedAmount(schedule, kStart), TokenAmount{0});
  EXPECT_OUTCOME_EQ(vestedAmount(schedule, kStart + 30 * kDay),
                    TokenAmount{3000});
  EXPECT_OUTCOME_EQ(vestedAmount(schedule, kStart + 60 * kDay),
                    TokenAmount{10000});
  EXPECT_OUTCOME_EQ(vestedAmount(schedule, kStart + 600 * kDay),
                    TokenAmount{10000});
  EXPECT_OUTCOME_EQ(vestedPercentage(schedule, kStart + 600 * kDay),
                    uint64_t{10000});
}

/**
 * @given Schedule with odd allocation
 * @when vested amount sampled every hour
 * @then it never decreases and never exceeds allocation
 */
TEST_F(VestingMathTest, Monotonic) {
  schedule.total_allocation = 9973;
  TokenAmount last{0};
  for (UnixTime t{kStart - 3600}; t <= kStart + 61 * kDay; t += 3600) {
    EXPECT_OUTCOME_TRUE(vested, vestedAmount(schedule, t));
    EXPECT_GE(vested, last);
    EXPECT_LE(vested, schedule.total_allocation);
    last = vested;
  }
  EXPECT_EQ(last, 9973);
}

/**
 * @given Phase with zero duration and gap between phases
 * @when time reaches phase start or stays in gap
 * @then instant unlock, nothing accrues in gap
 */
TEST_F(VestingMathTest, ZeroDurationAndGap) {
  schedule.phases = {{0, 0, 10}, {10 * kDay, 20 * kDay, 90}};
  EXPECT_OUTCOME_EQ(vestedAmount(schedule, kStart - 1), TokenAmount{0});
  EXPECT_OUTCOME_EQ(vestedAmount(schedule, kStart), TokenAmount{1000});
  EXPECT_OUTCOME_EQ(vestedAmount(schedule, kStart + 5 * kDay),
                    TokenAmount{1000});
  EXPECT_OUTCOME_EQ(vestedAmount(schedule, kStart + 15 * kDay),
                    TokenAmount{5500});
}

/**
 * @given Disabled schedule with clamped allocation
 * @when vested and releasable are queried
 * @then vested equals allocation, nothing is releasable
 */
TEST_F(VestingMathTest, Disabled) {
  schedule.total_allocation = 6500;
  schedule.released = 6500;
  schedule.disabled = true;
  EXPECT_OUTCOME_EQ(vestedAmount(schedule, kStart + 600 * kDay),
                    TokenAmount{6500});
  EXPECT_OUTCOME_EQ(releasableAmount(schedule, kStart + 600 * kDay),
                    TokenAmount{0});
  EXPECT_OUTCOME_EQ(vestedPercentage(schedule, kStart + 600 * kDay),
                    uint64_t{10000});
}

/**
 * @given Released above vested
 * @when releasable is computed
 * @then balance invariant error
 */
TEST_F(VestingMathTest, ReleasedAboveVested) {
  schedule.released = 1;
  EXPECT_OUTCOME_ERROR(VMExitCode::kErrBalanceInvariantBroken,
                       releasableAmount(schedule, kStart));
}

/**
 * @given Phase ending at maximal offset from schedule start
 * @when vested is computed shortly after start and halfway through
 * @then phase is interpolated linearly instead of unlocking at once
 */
TEST_F(VestingMathTest, LongPhaseInterpolated) {
  constexpr auto kMaxOffset{std::numeric_limits<UnixTime>::max()};
  schedule.phases = {{0, kMaxOffset, 100}};
  ASSERT_TRUE(validatePhases(schedule.phases));
  EXPECT_OUTCOME_EQ(vestedAmount(schedule, kStart + 1), TokenAmount{0});
  EXPECT_OUTCOME_EQ(vestedAmount(schedule, kStart + kMaxOffset / 2),
                    TokenAmount{4999});
  EXPECT_OUTCOME_EQ(releasableAmount(schedule, kMaxOffset), TokenAmount{9999});
}

/// Phase list validation
TEST(VestingPhasesTest, Validate) {
  EXPECT_TRUE(validatePhases(kTwoPhases));
  EXPECT_TRUE(validatePhases({{0, 0, 100}}));
  EXPECT_TRUE(validatePhases({{0, kDay, 40}, {2 * kDay, 3 * kDay, 60}}));

  EXPECT_FALSE(validatePhases({}));
  EXPECT_FALSE(validatePhases({{0, kDay, 99}}));
  EXPECT_FALSE(validatePhases({{0, kDay, 60}, {0, kDay, 60}}));
  EXPECT_FALSE(validatePhases({{kDay, 0, 100}}));
  EXPECT_FALSE(validatePhases({{-1, kDay, 100}}));
  EXPECT_FALSE(validatePhases({{0, 2 * kDay, 50}, {kDay, 3 * kDay, 50}}));
  EXPECT_FALSE(validatePhases({{0, kDay, 101}}));
}
