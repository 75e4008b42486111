/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "node/main/config.hpp"

#include <gtest/gtest.h>
#include <boost/filesystem/operations.hpp>
#include <boost/program_options/errors.hpp>
#include <fstream>

#include "testutil/outcome.hpp"

namespace fibon::node {
  using vm::actor::builtin::vesting::VestingPhase;

  constexpr Duration kDay{86400};

  Config readArgs(std::vector<const char *> args) {
    args.insert(args.begin(), "fibon_sim");
    return Config::read(static_cast<int>(args.size()), args.data());
  }

  /**
   * @given Vesting type string with two phases
   * @when parse
   * @then id and phases are parsed
   */
  TEST(Config, ParseVestingType) {
    EXPECT_OUTCOME_TRUE(type,
                        parseVestingType("1:0-2592000/30,2592000-5184000/70"));
    EXPECT_EQ(type.id, 1);
    EXPECT_EQ(type.phases,
              (VestingPhases{VestingPhase{0, 30 * kDay, 30},
                             VestingPhase{30 * kDay, 60 * kDay, 70}}));

    EXPECT_OUTCOME_TRUE(instant, parseVestingType("2:0-0/100"));
    EXPECT_EQ(instant.phases, (VestingPhases{VestingPhase{0, 0, 100}}));
  }

  /// Malformed vesting types
  TEST(Config, ParseVestingTypeInvalid) {
    for (const auto &str : {"",
                            "1",
                            "x:0-0/100",
                            "1:0-0",
                            "1:0-10/50",
                            "1:10-0/100",
                            "1:0-10/-100",
                            "1:0-10/50,5-20/50",
                            "-1:0-0/100"}) {
      EXPECT_OUTCOME_ERROR(ConfigError::kInvalidVestingType,
                           parseVestingType(str));
    }
  }

  /**
   * @given Schedule strings
   * @when parse
   * @then valid schedule parsed, zero and malformed amounts rejected
   */
  TEST(Config, ParseSchedule) {
    EXPECT_OUTCOME_TRUE(schedule,
                        parseSchedule("alice:1:100000000000000000000"));
    EXPECT_EQ(schedule.beneficiary, "alice");
    EXPECT_EQ(schedule.type_id, 1);
    EXPECT_EQ(schedule.amount, TokenAmount{"100000000000000000000"});

    EXPECT_OUTCOME_ERROR(ConfigError::kInvalidSchedule,
                         parseSchedule("alice:1:0"));
    EXPECT_OUTCOME_ERROR(ConfigError::kInvalidSchedule,
                         parseSchedule(":1:10"));
    EXPECT_OUTCOME_ERROR(ConfigError::kInvalidSchedule,
                         parseSchedule("alice:x:10"));
    EXPECT_OUTCOME_ERROR(ConfigError::kInvalidAmount,
                         parseSchedule("alice:1:1e3"));
    EXPECT_OUTCOME_ERROR(ConfigError::kInvalidSchedule,
                         parseSchedule("alice:1"));
  }

  /// Amounts are non-negative decimal integers
  TEST(Config, ParseAmount) {
    EXPECT_OUTCOME_EQ(parseAmount("0"), TokenAmount{0});
    EXPECT_OUTCOME_EQ(parseAmount("1000"), TokenAmount{1000});
    EXPECT_OUTCOME_ERROR(ConfigError::kInvalidAmount, parseAmount(""));
    EXPECT_OUTCOME_ERROR(ConfigError::kInvalidAmount, parseAmount("-1"));
    EXPECT_OUTCOME_ERROR(ConfigError::kInvalidAmount, parseAmount("1.5"));
  }

  /// Report offsets are non-negative seconds
  TEST(Config, ParseReportOffset) {
    EXPECT_OUTCOME_EQ(parseReportOffset("0"), Duration{0});
    EXPECT_OUTCOME_EQ(parseReportOffset("86400"), kDay);
    EXPECT_OUTCOME_ERROR(ConfigError::kInvalidReportOffset,
                         parseReportOffset("-1"));
    EXPECT_OUTCOME_ERROR(ConfigError::kInvalidReportOffset,
                         parseReportOffset("day"));
  }

  /**
   * @given Command line with genesis options
   * @when read config
   * @then all options are parsed
   */
  TEST(Config, ReadCommandLine) {
    const auto config{readArgs({"--owner",
                                "alice",
                                "--owner",
                                "bob",
                                "--threshold",
                                "2",
                                "--treasury",
                                "5000",
                                "--mint",
                                "20000",
                                "--vesting-type",
                                "1:0-0/100",
                                "--schedule",
                                "carol:1:100",
                                "--genesis-time",
                                "2020-01-01T00:00:00Z",
                                "--report-at",
                                "86400",
                                "--log",
                                "d"})};
    EXPECT_EQ(config.owners, (std::vector<std::string>{"alice", "bob"}));
    EXPECT_EQ(config.threshold, size_t{2});
    EXPECT_EQ(config.treasury, 5000);
    EXPECT_EQ(config.mint, 20000);
    ASSERT_EQ(config.vesting_types.size(), size_t{1});
    EXPECT_EQ(config.vesting_types[0].id, 1);
    ASSERT_EQ(config.schedules.size(), size_t{1});
    EXPECT_EQ(config.schedules[0].beneficiary, "carol");
    ASSERT_TRUE(config.genesis_time);
    EXPECT_EQ(*config.genesis_time, 1577836800);
    EXPECT_EQ(config.report_at, (std::vector<Duration>{86400}));
    EXPECT_EQ(config.log_level, spdlog::level::debug);
    EXPECT_FALSE(config.log_file);
  }

  /**
   * @given Malformed command lines
   * @when read config
   * @then program options error is thrown
   */
  TEST(Config, ReadInvalid) {
    namespace po = boost::program_options;
    EXPECT_THROW(readArgs({}), po::error);
    EXPECT_THROW(readArgs({"--owner", "alice", "--treasury", "-5"}), po::error);
    EXPECT_THROW(readArgs({"--owner", "alice", "--schedule", "bob:1"}),
                 po::error);
    EXPECT_THROW(readArgs({"--owner", "alice", "--genesis-time", "yesterday"}),
                 po::error);
    EXPECT_THROW(readArgs({"--owner", "alice", "--report-at", "-1"}),
                 po::error);
    EXPECT_THROW(readArgs({"--owner", "alice", "--report-at=-86400"}),
                 po::invalid_option_value);
    EXPECT_THROW(readArgs({"--owner", "alice", "--config", "/nonexistent"}),
                 po::error);
  }

  /**
   * @given Config file with owners and schedules
   * @when read config with command line adding owner
   * @then values of both sources are combined
   */
  TEST(Config, ReadConfigFile) {
    const auto path{boost::filesystem::temp_directory_path()
                    / boost::filesystem::unique_path()};
    {
      std::ofstream file{path.string()};
      file << "owner = alice\n"
              "owner = bob\n"
              "threshold = 2\n"
              "vesting-type = 1:0-2592000/30,2592000-5184000/70\n"
              "schedule = carol:1:10000\n";
    }
    const auto config{readArgs({"--config", path.c_str(), "--owner", "dave"})};
    boost::filesystem::remove(path);

    EXPECT_EQ(config.owners,
              (std::vector<std::string>{"dave", "alice", "bob"}));
    EXPECT_EQ(config.threshold, size_t{2});
    ASSERT_EQ(config.vesting_types.size(), size_t{1});
    EXPECT_EQ(config.vesting_types[0].phases.size(), size_t{2});
    ASSERT_EQ(config.schedules.size(), size_t{1});
    EXPECT_EQ(config.schedules[0].amount, 10000);
    EXPECT_EQ(config.treasury, 0);
    EXPECT_FALSE(config.genesis_time);
  }
}  // namespace fibon::node
