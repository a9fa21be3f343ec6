/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "logger/logger_spdlog.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace {

  spdlog::level::level_enum getSpdlogLogLevel(logger::LogLevel level) {
    switch (level) {
      case logger::LogLevel::kTrace:
        return spdlog::level::trace;
      case logger::LogLevel::kDebug:
        return spdlog::level::debug;
      case logger::LogLevel::kInfo:
        return spdlog::level::info;
      case logger::LogLevel::kWarn:
        return spdlog::level::warn;
      case logger::LogLevel::kError:
        return spdlog::level::err;
      case logger::LogLevel::kCritical:
        return spdlog::level::critical;
    }
    return spdlog::level::info;
  }

  std::shared_ptr<spdlog::logger> getOrCreateLogger(const std::string &tag) {
    static std::mutex mutex;
    std::lock_guard<std::mutex> lock(mutex);
    auto logger = spdlog::get(tag);
    if (logger == nullptr) {
      logger = spdlog::stdout_color_mt(tag);
    }
    return logger;
  }

}  // namespace

namespace logger {

  const LogLevel kDefaultLogLevel = LogLevel::kInfo;

  const std::string kDefaultLogPattern =
      "[%Y-%m-%d %H:%M:%S.%F][th:%t][%=8l][%n]: %v";

  LoggerSpdlog::LoggerSpdlog(std::string tag, ConstLoggerConfigPtr config)
      : tag_(std::move(tag)),
        config_(std::move(config)),
        logger_(getOrCreateLogger(tag_)) {
    logger_->set_level(getSpdlogLogLevel(config_->log_level));
    logger_->set_pattern(config_->pattern);
  }

  void LoggerSpdlog::logInternal(Level level, const std::string &s) const {
    logger_->log(getSpdlogLogLevel(level), "{}", s);
  }

  bool LoggerSpdlog::shouldLog(Level level) const {
    return config_->log_level <= level;
  }

  const char *toString(LogLevel level) {
    switch (level) {
      case LogLevel::kTrace:
        return "trace";
      case LogLevel::kDebug:
        return "debug";
      case LogLevel::kInfo:
        return "info";
      case LogLevel::kWarn:
        return "warning";
      case LogLevel::kError:
        return "error";
      case LogLevel::kCritical:
        return "critical";
    }
    return "unknown";
  }

  std::string boolRepr(bool value) {
    return value ? "true" : "false";
  }

}  // namespace logger
