/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "logger/logger_manager.hpp"

namespace {
  const std::string kTagHierarchySeparator = "/";
}  // namespace

namespace logger {

  LoggerManagerTree::LoggerManagerTree(ConstLoggerConfigPtr config)
      : node_tag_{}, full_tag_{}, config_(std::move(config)) {}

  LoggerManagerTree::LoggerManagerTree(LoggerConfig config)
      : LoggerManagerTree(
            std::make_shared<const LoggerConfig>(std::move(config))) {}

  LoggerManagerTree::LoggerManagerTree(std::string full_tag,
                                       std::string node_tag,
                                       ConstLoggerConfigPtr config)
      : node_tag_(std::move(node_tag)),
        full_tag_(std::move(full_tag)),
        config_(std::move(config)) {}

  LoggerManagerTreePtr LoggerManagerTree::registerChild(
      std::string tag,
      boost::optional<LogLevel> log_level,
      boost::optional<LogPatterns> patterns) {
    LoggerConfig child_config{log_level.value_or(config_->log_level),
                              patterns.value_or(config_->patterns)};
    auto full_tag = makeChildFullTag(tag);
    // Make the child config share the parent one if nothing is overridden.
    auto child_config_ptr = (log_level or patterns)
        ? std::make_shared<const LoggerConfig>(std::move(child_config))
        : config_;
    LoggerManagerTreePtr child(new LoggerManagerTree(
        std::move(full_tag), tag, std::move(child_config_ptr)));
    children_[std::move(tag)] = child;
    return child;
  }

  LoggerPtr LoggerManagerTree::getLogger() {
    if (not logger_) {
      logger_ = std::make_shared<LoggerSpdlog>(full_tag_, config_);
    }
    return logger_;
  }

  LoggerManagerTreePtr LoggerManagerTree::getChild(const std::string &tag) {
    auto it = children_.find(tag);
    if (it != children_.end()) {
      return it->second;
    }
    return registerChild(tag, boost::none, boost::none);
  }

  std::string LoggerManagerTree::makeChildFullTag(
      const std::string &child_tag) const {
    if (full_tag_.empty()) {
      return child_tag;
    }
    return full_tag_ + kTagHierarchySeparator + child_tag;
  }

}  // namespace logger
