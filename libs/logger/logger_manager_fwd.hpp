/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KMSIGN_LOGGER_LOGGER_MANAGER_FWD_HPP
#define KMSIGN_LOGGER_LOGGER_MANAGER_FWD_HPP

#include <memory>

namespace logger {

  class LoggerManagerTree;

  using LoggerManagerTreePtr = std::shared_ptr<LoggerManagerTree>;

}  // namespace logger

#endif  // KMSIGN_LOGGER_LOGGER_MANAGER_FWD_HPP
