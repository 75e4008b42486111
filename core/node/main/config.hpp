/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/filesystem/path.hpp>
#include <boost/optional.hpp>

#include "common/logger.hpp"
#include "common/outcome.hpp"
#include "vm/actor/builtin/vesting/vesting_types.hpp"

namespace fibon::node {
  using primitives::Duration;
  using primitives::TokenAmount;
  using primitives::UnixTime;
  using vm::actor::builtin::vesting::VestingPhases;
  using vm::actor::builtin::vesting::VestingTypeId;

  enum class ConfigError {
    kInvalidVestingType = 1,
    kInvalidSchedule,
    kInvalidAmount,
    kInvalidReportOffset,
  };

  /// "id:start-end/pct,..." with offsets in seconds from schedule start
  struct VestingTypeConfig {
    VestingTypeId id{};
    VestingPhases phases;
  };

  /// "beneficiary:type:amount", beneficiary is account name
  struct ScheduleConfig {
    std::string beneficiary;
    VestingTypeId type_id{};
    TokenAmount amount;
  };

  outcome::result<VestingTypeConfig> parseVestingType(const std::string &str);

  outcome::result<ScheduleConfig> parseSchedule(const std::string &str);

  outcome::result<TokenAmount> parseAmount(const std::string &str);

  /// Non-negative offset in seconds
  outcome::result<Duration> parseReportOffset(const std::string &str);

  struct Config {
    spdlog::level::level_enum log_level{spdlog::level::info};
    boost::optional<boost::filesystem::path> log_file;

    /// Account names of multisig owners
    std::vector<std::string> owners;
    size_t threshold{1};
    /// Native balance of multisig at genesis
    TokenAmount treasury;
    /// Tokens minted into vesting engine at genesis
    TokenAmount mint;
    std::vector<VestingTypeConfig> vesting_types;
    std::vector<ScheduleConfig> schedules;
    /// Current time if not set
    boost::optional<UnixTime> genesis_time;
    /// Report offsets in seconds from genesis
    std::vector<Duration> report_at;

    /**
     * Reads command line and optional config file.
     * Throws boost::program_options::error on malformed options.
     */
    static Config read(int argc, const char *const argv[]);
  };
}  // namespace fibon::node

OUTCOME_HPP_DECLARE_ERROR(fibon::node, ConfigError);
