/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KMSIGN_LOGGER_LOGGER_HPP
#define KMSIGN_LOGGER_LOGGER_HPP

#include "logger/logger_fwd.hpp"

#include <exception>
#include <string>
#include <string_view>
#include <type_traits>

#include <fmt/core.h>
#include <fmt/format.h>

namespace fmt {
  /// Formats any object with a toString() method through its string form,
  /// with the usual string format specs: log.info("{:>24}", descriptor)
  template <typename T>
  struct formatter<
      T,
      std::enable_if_t<std::is_same<decltype(std::declval<T>().toString()),
                                    std::string>::value,
                       char>> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const T &val, FormatContext &ctx) const
        -> decltype(ctx.out()) {
      return formatter<std::string_view>::format(val.toString(), ctx);
    }
  };
}  // namespace fmt

namespace logger {

  /// Log levels
  enum class LogLevel {
    kTrace,
    kDebug,
    kInfo,
    kWarn,
    kError,
    kCritical,
  };

  extern const LogLevel kDefaultLogLevel;

  /// Level name as used in configuration files, e.g. "warning"
  const char *toString(LogLevel level);

  class Logger {
   public:
    using Level = LogLevel;

    virtual ~Logger() = default;

    // --- Logging functions ---

    template <typename... Args>
    void trace(const std::string &format, const Args &... args) const {
      log(LogLevel::kTrace, format, args...);
    }

    template <typename... Args>
    void debug(const std::string &format, const Args &... args) const {
      log(LogLevel::kDebug, format, args...);
    }

    template <typename... Args>
    void info(const std::string &format, const Args &... args) const {
      log(LogLevel::kInfo, format, args...);
    }

    template <typename... Args>
    void warn(const std::string &format, const Args &... args) const {
      log(LogLevel::kWarn, format, args...);
    }

    template <typename... Args>
    void error(const std::string &format, const Args &... args) const {
      log(LogLevel::kError, format, args...);
    }

    template <typename... Args>
    void critical(const std::string &format, const Args &... args) const {
      log(LogLevel::kCritical, format, args...);
    }

    template <typename... Args>
    void log(Level level,
             const std::string &format,
             const Args &... args) const {
      if (shouldLog(level)) {
        try {
          logInternal(level, fmt::format(fmt::runtime(format), args...));
        } catch (const std::exception &error) {
          std::string error_msg("Exception was thrown while logging: ");
          logInternal(LogLevel::kError, error_msg.append(error.what()));
        }
      }
    }

   protected:
    virtual void logInternal(Level level, const std::string &s) const = 0;

    /// Whether the configured logging level is at least as verbose as the
    /// one given in parameter.
    virtual bool shouldLog(Level level) const = 0;
  };

  /**
   * Convert bool value to human readable string repr
   * @param value value for transformation
   * @return "true" or "false"
   */
  std::string boolRepr(bool value);

}  // namespace logger

namespace fmt {
  template <>
  struct formatter<logger::LogLevel, char> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(logger::LogLevel level, FormatContext &ctx) const
        -> decltype(ctx.out()) {
      return formatter<std::string_view>::format(logger::toString(level), ctx);
    }
  };
}  // namespace fmt

#endif  // KMSIGN_LOGGER_LOGGER_HPP
