/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>
#include <soralog/level.hpp>
#include <soralog/logger.hpp>
#include <soralog/logging_system.hpp>
#include <soralog/macro.hpp>

#include "utils/ctor_limiters.hpp"

namespace blskey::log {
  using soralog::Level;

  using Logger = qtils::SharedRef<soralog::Logger>;

  enum class LogError : uint8_t { UNKNOWN_LEVEL = 1, UNKNOWN_GROUP };

  /// Level by name: trace, debug, verbose, info, warn, error, critical, off
  outcome::result<Level> str2lvl(std::string_view str);

  inline static std::string defaultGroupName{"blskey"};

  class LoggingSystem : public Singleton<LoggingSystem> {
   public:
    explicit LoggingSystem(
        std::shared_ptr<soralog::LoggingSystem> logging_system);

    [[nodiscard]] Logger getLogger(const std::string &logger_name,
                                   const std::string &group_name) const {
      return logging_system_->getLogger(logger_name, group_name);
    }

    [[nodiscard]] bool setLevelOfGroup(const std::string &group_name,
                                       Level level) const {
      return logging_system_->setLevelOfGroup(group_name, level);
    }

    /**
     * Apply one `-l` value: `<level>` sets level of default group,
     * `<group>=<level>` sets level of named group
     */
    outcome::result<void> applyLevelOverride(std::string_view chunk) const;

    /// Apply every `-l` value, bad ones are reported to stderr and skipped
    void tuneLoggingSystem(const std::vector<std::string> &chunks) const;

   private:
    std::shared_ptr<soralog::LoggingSystem> logging_system_;
  };

}  // namespace blskey::log

OUTCOME_HPP_DECLARE_ERROR(blskey::log, LogError);
