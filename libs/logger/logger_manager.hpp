/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KMSIGN_LOGGER_LOGGER_MANAGER_HPP
#define KMSIGN_LOGGER_LOGGER_MANAGER_HPP

#include "logger/logger_manager_fwd.hpp"

#include <map>
#include <mutex>
#include <string>

#include "logger/logger_fwd.hpp"
#include "logger/logger_spdlog.hpp"

namespace logger {

  /**
   * A node of the tree of loggers. Each node produces a logger tagged with
   * the path from the root ("Signer/Resolver") and shares its config with
   * its children.
   */
  class LoggerManagerTree {
   public:
    explicit LoggerManagerTree(ConstLoggerConfigPtr config);

    explicit LoggerManagerTree(LoggerConfig config);

    /// Get this node's logger.
    LoggerPtr getLogger();

    /**
     * Get or create a child node.
     * @param tag - the tag of the child, appended to this node's full tag
     */
    LoggerManagerTreePtr getChild(const std::string &tag);

   private:
    LoggerManagerTree(std::string full_tag, ConstLoggerConfigPtr config);

    const std::string full_tag_;
    const ConstLoggerConfigPtr config_;
    std::mutex mutex_;
    LoggerPtr logger_;
    std::map<std::string, LoggerManagerTreePtr> children_;
  };

}  // namespace logger

#endif  // KMSIGN_LOGGER_LOGGER_MANAGER_HPP
