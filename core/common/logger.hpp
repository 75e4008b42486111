/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

namespace fibon::common {
  using Logger = std::shared_ptr<spdlog::logger>;

  /**
   * Sets level of all loggers and optionally duplicates their output to file.
   * Called once at startup, before loggers are created.
   * @param level - minimal level of messages
   * @param file_path - log file, empty for console only
   */
  void configureLogging(spdlog::level::level_enum level,
                        const std::string &file_path);

  /// Logger named tag, created on first request
  Logger createLogger(const std::string &tag);
}  // namespace fibon::common
