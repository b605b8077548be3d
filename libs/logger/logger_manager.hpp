/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef TELLER_LOGGER_LOGGER_MANAGER_HPP
#define TELLER_LOGGER_LOGGER_MANAGER_HPP

#include "logger/logger_manager_fwd.hpp"

#include <map>
#include <string>

#include <boost/optional.hpp>
#include "logger/logger_fwd.hpp"
#include "logger/logger_spdlog.hpp"

namespace logger {

  /**
   * A node of the logger configuration tree. Every node knows its config
   * and lazily creates its logger and child nodes. Children that were not
   * registered explicitly inherit the parent configuration.
   */
  class LoggerManagerTree {
   public:
    explicit LoggerManagerTree(ConstLoggerConfigPtr config);

    explicit LoggerManagerTree(LoggerConfig config);

    /**
     * Register a child configuration. The absent parameters are taken from
     * the parent config.
     * @param tag - the child tag
     * @param log_level - the child log level override
     * @param patterns - the child log patterns override
     * @return the registered child node
     */
    LoggerManagerTreePtr registerChild(std::string tag,
                                       boost::optional<LogLevel> log_level,
                                       boost::optional<LogPatterns> patterns);

    /// Get this node's logger.
    LoggerPtr getLogger();

    /**
     * Get a child node by its tag. If it was not registered, a new one
     * with the parent's config is created.
     */
    LoggerManagerTreePtr getChild(const std::string &tag);

   private:
    LoggerManagerTree(std::string full_tag,
                      std::string node_tag,
                      ConstLoggerConfigPtr config);

    std::string makeChildFullTag(const std::string &child_tag) const;

    const std::string node_tag_;
    const std::string full_tag_;
    ConstLoggerConfigPtr config_;
    LoggerPtr logger_;
    std::map<std::string, LoggerManagerTreePtr> children_;
  };

}  // namespace logger

#endif  // TELLER_LOGGER_LOGGER_MANAGER_HPP
