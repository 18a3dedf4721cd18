/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <array>
#include <iostream>
#include <tuple>
#include <utility>

OUTCOME_CPP_DEFINE_CATEGORY(blskey::log, LogError, e) {
  using E = blskey::log::LogError;
  switch (e) {
    case E::UNKNOWN_LEVEL:
      return "Unknown log level";
    case E::UNKNOWN_GROUP:
      return "Unknown log group";
  }
  return "Unknown LogError";
}

namespace blskey::log {

  namespace {
    // clang-format off
    constexpr std::array<std::pair<std::string_view, Level>, 14> kLevelNames{{
        {"trace", Level::TRACE},
        {"debug", Level::DEBUG},
        {"verbose", Level::VERBOSE},
        {"info", Level::INFO}, {"inf", Level::INFO},
        {"warning", Level::WARN}, {"warn", Level::WARN},
        {"error", Level::ERROR}, {"err", Level::ERROR},
        {"critical", Level::CRITICAL}, {"crit", Level::CRITICAL},
        {"off", Level::OFF}, {"no", Level::OFF},
        {"none", Level::OFF},
    }};
    // clang-format on
  }  // namespace

  outcome::result<Level> str2lvl(std::string_view str) {
    for (auto &[name, level] : kLevelNames) {
      if (name == str) {
        return level;
      }
    }
    return LogError::UNKNOWN_LEVEL;
  }

  LoggingSystem::LoggingSystem(
      std::shared_ptr<soralog::LoggingSystem> logging_system)
      : logging_system_(std::move(logging_system)) {}

  outcome::result<void> LoggingSystem::applyLevelOverride(
      std::string_view chunk) const {
    auto eq = chunk.find('=');
    if (eq == std::string_view::npos) {
      BOOST_OUTCOME_TRY(auto level, str2lvl(chunk));
      std::ignore = setLevelOfGroup(defaultGroupName, level);
      return outcome::success();
    }

    std::string group_name{chunk.substr(0, eq)};
    BOOST_OUTCOME_TRY(auto level, str2lvl(chunk.substr(eq + 1)));
    if (not setLevelOfGroup(group_name, level)) {
      return LogError::UNKNOWN_GROUP;
    }
    return outcome::success();
  }

  void LoggingSystem::tuneLoggingSystem(
      const std::vector<std::string> &chunks) const {
    for (auto &chunk : chunks) {
      if (auto res = applyLevelOverride(chunk); res.has_error()) {
        std::cerr << "Ignored log option '" << chunk
                  << "': " << res.error().message() << '\n';
      }
    }
  }

}  // namespace blskey::log
