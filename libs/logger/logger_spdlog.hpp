/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KMSIGN_LOGGER_LOGGER_SPDLOG_HPP
#define KMSIGN_LOGGER_LOGGER_SPDLOG_HPP

#include "logger/logger.hpp"

#include <memory>
#include <string>

namespace spdlog {
  class logger;
}

namespace logger {

  extern const std::string kDefaultLogPattern;

  struct LoggerConfig {
    LogLevel log_level{kDefaultLogLevel};
    std::string pattern{kDefaultLogPattern};
  };
  using ConstLoggerConfigPtr = std::shared_ptr<const LoggerConfig>;

  /// Logger writing to the process stdout through spdlog
  class LoggerSpdlog : public Logger {
   public:
    /**
     * @param tag - the tagged name of the logger, printed with every message
     * @param config - the logger configuration
     */
    LoggerSpdlog(std::string tag, ConstLoggerConfigPtr config);

   private:
    void logInternal(Level level, const std::string &s) const override;

    bool shouldLog(Level level) const override;

    const std::string tag_;
    const ConstLoggerConfigPtr config_;
    const std::shared_ptr<spdlog::logger> logger_;
  };

}  // namespace logger

#endif  // KMSIGN_LOGGER_LOGGER_SPDLOG_HPP
