/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "logger/logger_manager.hpp"

#include <fmt/core.h>

namespace logger {

  LoggerManagerTree::LoggerManagerTree(ConstLoggerConfigPtr config)
      : LoggerManagerTree("kmsign", std::move(config)) {}

  LoggerManagerTree::LoggerManagerTree(LoggerConfig config)
      : LoggerManagerTree(
          std::make_shared<const LoggerConfig>(std::move(config))) {}

  LoggerManagerTree::LoggerManagerTree(std::string full_tag,
                                       ConstLoggerConfigPtr config)
      : full_tag_(std::move(full_tag)), config_(std::move(config)) {}

  LoggerPtr LoggerManagerTree::getLogger() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (not logger_) {
      logger_ = std::make_shared<LoggerSpdlog>(full_tag_, config_);
    }
    return logger_;
  }

  LoggerManagerTreePtr LoggerManagerTree::getChild(const std::string &tag) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = children_.find(tag);
    if (it == children_.end()) {
      // private constructor is not reachable from make_shared
      LoggerManagerTreePtr child{new LoggerManagerTree(
          fmt::format("{}/{}", full_tag_, tag), config_)};
      it = children_.emplace(tag, std::move(child)).first;
    }
    return it->second;
  }

}  // namespace logger
