/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "node/main/config.hpp"

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <fstream>
#include <iostream>

#include "cli/validate/with.hpp"
#include "clock/time.hpp"
#include "vm/actor/builtin/vesting/vesting_math.hpp"

namespace fibon::node {
  CLI_VALIDATE(VestingTypeConfig) {
    return validateWith(out, values, parseVestingType);
  }

  CLI_VALIDATE(ScheduleConfig) {
    return validateWith(out, values, parseSchedule);
  }

  namespace {
    struct ReportOffset {
      Duration seconds{};
    };

    CLI_VALIDATE(ReportOffset) {
      const auto parse{
          [](const std::string &str) -> outcome::result<ReportOffset> {
            OUTCOME_TRY(seconds, parseReportOffset(str));
            return ReportOffset{seconds};
          }};
      return validateWith(out, values, parse);
    }

    template <typename T>
    boost::optional<T> parseNumber(const std::string &str) {
      T value;
      if (str.empty() || (std::is_unsigned_v<T> && str[0] == '-')
          || !boost::conversion::try_lexical_convert(str, value)) {
        return boost::none;
      }
      return value;
    }

    std::vector<std::string> split(const std::string &str, const char *by) {
      std::vector<std::string> parts;
      boost::algorithm::split(parts, str, boost::algorithm::is_any_of(by));
      return parts;
    }

    spdlog::level::level_enum getLogLevel(char level) {
      switch (level) {
        case 'e':
          return spdlog::level::err;
        case 'w':
          return spdlog::level::warn;
        case 'd':
          return spdlog::level::debug;
        case 't':
          return spdlog::level::trace;
      }
      return spdlog::level::info;
    }
  }  // namespace

  outcome::result<TokenAmount> parseAmount(const std::string &str) {
    if (str.empty() || str.find_first_not_of("0123456789") != std::string::npos) {
      return outcome::failure(ConfigError::kInvalidAmount);
    }
    return TokenAmount{str.c_str()};
  }

  outcome::result<Duration> parseReportOffset(const std::string &str) {
    const auto seconds{parseNumber<Duration>(str)};
    if (!seconds || *seconds < 0) {
      return outcome::failure(ConfigError::kInvalidReportOffset);
    }
    return *seconds;
  }

  outcome::result<VestingTypeConfig> parseVestingType(const std::string &str) {
    const auto colon{str.find(':')};
    if (colon == std::string::npos) {
      return ConfigError::kInvalidVestingType;
    }
    VestingTypeConfig type;
    if (auto id{parseNumber<VestingTypeId>(str.substr(0, colon))}) {
      type.id = *id;
    } else {
      return ConfigError::kInvalidVestingType;
    }
    for (const auto &phase_str : split(str.substr(colon + 1), ",")) {
      const auto parts{split(phase_str, "-/")};
      if (parts.size() != 3) {
        return ConfigError::kInvalidVestingType;
      }
      auto start{parseNumber<Duration>(parts[0])};
      auto end{parseNumber<Duration>(parts[1])};
      auto percentage{parseNumber<uint64_t>(parts[2])};
      if (!start || !end || !percentage) {
        return ConfigError::kInvalidVestingType;
      }
      type.phases.push_back({*start, *end, *percentage});
    }
    if (!vm::actor::builtin::vesting::validatePhases(type.phases)) {
      return ConfigError::kInvalidVestingType;
    }
    return type;
  }

  outcome::result<ScheduleConfig> parseSchedule(const std::string &str) {
    const auto parts{split(str, ":")};
    if (parts.size() != 3 || parts[0].empty()) {
      return ConfigError::kInvalidSchedule;
    }
    ScheduleConfig schedule;
    schedule.beneficiary = parts[0];
    if (auto type_id{parseNumber<VestingTypeId>(parts[1])}) {
      schedule.type_id = *type_id;
    } else {
      return ConfigError::kInvalidSchedule;
    }
    OUTCOME_TRYA(schedule.amount, parseAmount(parts[2]));
    if (schedule.amount == 0) {
      return ConfigError::kInvalidSchedule;
    }
    return schedule;
  }

  Config Config::read(int argc, const char *const argv[]) {
    Config config;
    struct {
      char log_level{};
      boost::optional<boost::filesystem::path> config_file;
      std::string treasury, mint;
      boost::optional<std::string> genesis_time;
      std::vector<ReportOffset> report_at;
    } raw;
    namespace po = boost::program_options;
    po::options_description desc("Fibon simulator options");
    auto option{desc.add_options()};
    option("help,h", "print usage message");
    option("config,c", po::value(&raw.config_file), "config file");
    option("log,l",
           po::value(&raw.log_level)->default_value('i'),
           "log level, [e,w,i,d,t]");
    option("log-file", po::value(&config.log_file), "also log to file");

    po::options_description genesis_desc("Genesis options");
    auto genesis_option{genesis_desc.add_options()};
    genesis_option("owner",
                   po::value(&config.owners)->composing()->required(),
                   "multisig owner account name");
    genesis_option("threshold",
                   po::value(&config.threshold)->default_value(1),
                   "approvals required to execute transaction");
    genesis_option("treasury",
                   po::value(&raw.treasury)->default_value("0"),
                   "native balance of multisig");
    genesis_option("mint",
                   po::value(&raw.mint)->default_value("0"),
                   "tokens minted into vesting engine");
    genesis_option("vesting-type",
                   po::value(&config.vesting_types)->composing(),
                   "vesting type, id:start-end/pct,...");
    genesis_option("schedule",
                   po::value(&config.schedules)->composing(),
                   "vesting schedule, beneficiary:type:amount");
    genesis_option("genesis-time",
                   po::value(&raw.genesis_time),
                   "genesis time, YYYY-MM-DDTHH:MM:SSZ");
    genesis_option("report-at",
                   po::value(&raw.report_at)->composing(),
                   "report offset in seconds from genesis");
    desc.add(genesis_desc);

    po::variables_map vm;
    po::store(po::parse_command_line(argc, argv, desc), vm);
    if (vm.count("help") != 0) {
      std::cerr << desc << std::endl;
      exit(EXIT_SUCCESS);
    }
    if (vm.count("config") != 0) {
      const auto path{vm["config"].as<boost::filesystem::path>()};
      std::ifstream config_file{path.string()};
      if (!config_file.good()) {
        boost::throw_exception(
            po::error{"cannot open config file " + path.string()});
      }
      po::store(po::parse_config_file(config_file, desc), vm);
    }
    po::notify(vm);

    const auto read_amount{[](const std::string &str) {
      auto amount{parseAmount(str)};
      if (!amount) {
        boost::throw_exception(po::invalid_option_value{str});
      }
      return amount.value();
    }};
    config.treasury = read_amount(raw.treasury);
    config.mint = read_amount(raw.mint);

    if (raw.genesis_time) {
      auto time{clock::unixTimeFromString(*raw.genesis_time)};
      if (!time) {
        boost::throw_exception(po::invalid_option_value{*raw.genesis_time});
      }
      config.genesis_time = time.value().count();
    }

    for (const auto &offset : raw.report_at) {
      config.report_at.push_back(offset.seconds);
    }

    config.log_level = getLogLevel(raw.log_level);
    return config;
  }
}  // namespace fibon::node

OUTCOME_CPP_DEFINE_CATEGORY(fibon::node, ConfigError, e) {
  using fibon::node::ConfigError;
  switch (e) {
    case ConfigError::kInvalidVestingType:
      return "ConfigError: invalid vesting type";
    case ConfigError::kInvalidSchedule:
      return "ConfigError: invalid schedule";
    case ConfigError::kInvalidAmount:
      return "ConfigError: invalid amount";
    case ConfigError::kInvalidReportOffset:
      return "ConfigError: invalid report offset";
  }
  return "ConfigError: unknown error";
}
