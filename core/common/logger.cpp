/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace fibon::common {
  namespace {
    constexpr auto kPattern{"%Y-%m-%d %H:%M:%S.%e %n %^%L%$ %v"};

    std::vector<spdlog::sink_ptr> &sinks() {
      static std::vector<spdlog::sink_ptr> sinks{
          std::make_shared<spdlog::sinks::stdout_color_sink_mt>()};
      return sinks;
    }
  }  // namespace

  void configureLogging(spdlog::level::level_enum level,
                        const std::string &file_path) {
    spdlog::set_level(level);
    if (!file_path.empty()) {
      sinks().push_back(
          std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_path));
    }
  }

  Logger createLogger(const std::string &tag) {
    if (auto logger{spdlog::get(tag)}) {
      return logger;
    }
    auto logger{std::make_shared<spdlog::logger>(
        tag, sinks().begin(), sinks().end())};
    logger->set_pattern(kPattern);
    logger->set_level(spdlog::get_level());
    spdlog::register_logger(logger);
    return logger;
  }
}  // namespace fibon::common
