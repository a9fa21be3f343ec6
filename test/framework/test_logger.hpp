/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KMSIGN_TEST_FRAMEWORK_TEST_LOGGER_HPP
#define KMSIGN_TEST_FRAMEWORK_TEST_LOGGER_HPP

#include <string>

#include "logger/logger.hpp"
#include "logger/logger_manager_fwd.hpp"

namespace framework {

  /**
   * Logger manager of the tests, one per level, created on first use.
   * Loggers of the code under test are its children, tagged "kmsign/Test/...".
   */
  logger::LoggerManagerTreePtr getTestLoggerManager(
      logger::LogLevel log_level = logger::LogLevel::kDebug);

  logger::LoggerPtr getTestLogger(std::string const &tag);

}  // namespace framework

#endif  // KMSIGN_TEST_FRAMEWORK_TEST_LOGGER_HPP
