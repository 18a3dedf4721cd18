/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "tests/testutil/prepare_loggers.hpp"

using blskey::log::Level;
using blskey::log::LogError;
using blskey::log::str2lvl;

TEST(Str2LvlTest, FullAndShortNames) {
  ASSERT_OUTCOME_SUCCESS(trace, str2lvl("trace"));
  EXPECT_EQ(trace, Level::TRACE);
  ASSERT_OUTCOME_SUCCESS(warn, str2lvl("warn"));
  EXPECT_EQ(warn, Level::WARN);
  ASSERT_OUTCOME_SUCCESS(warning, str2lvl("warning"));
  EXPECT_EQ(warning, Level::WARN);
  ASSERT_OUTCOME_SUCCESS(crit, str2lvl("crit"));
  EXPECT_EQ(crit, Level::CRITICAL);
  ASSERT_OUTCOME_SUCCESS(off, str2lvl("no"));
  EXPECT_EQ(off, Level::OFF);
}

TEST(Str2LvlTest, UnknownName) {
  ASSERT_OUTCOME_ERROR(str2lvl("loud"), LogError::UNKNOWN_LEVEL);
  ASSERT_OUTCOME_ERROR(str2lvl(""), LogError::UNKNOWN_LEVEL);
  ASSERT_OUTCOME_ERROR(str2lvl("DEBUG"), LogError::UNKNOWN_LEVEL);
}

class LevelOverrideTest : public ::testing::Test {
 protected:
  void TearDown() override {
    std::ignore = logsys->setLevelOfGroup("crypto", Level::INFO);
    std::ignore = logsys->setLevelOfGroup("cli", Level::INFO);
    std::ignore = logsys->setLevelOfGroup(blskey::log::defaultGroupName,
                                          Level::INFO);
  }

  qtils::SharedRef<blskey::log::LoggingSystem> logsys =
      testutil::prepareLoggers();
};

/**
 * @given `<group>=<level>` override of a known group
 * @when it is applied
 * @then loggers of that group take the new level
 */
TEST_F(LevelOverrideTest, NamedGroup) {
  EXPECT_OUTCOME_SUCCESS(logsys->applyLevelOverride("crypto=trace"));

  auto logger = logsys->getLogger("NamedGroup", "crypto");
  EXPECT_EQ(logger->level(), Level::TRACE);
}

TEST_F(LevelOverrideTest, BareLevelAppliesToDefaultGroup) {
  EXPECT_OUTCOME_SUCCESS(logsys->applyLevelOverride("debug"));

  auto logger =
      logsys->getLogger("BareLevel", blskey::log::defaultGroupName);
  EXPECT_EQ(logger->level(), Level::DEBUG);
}

TEST_F(LevelOverrideTest, BadOverrides) {
  ASSERT_OUTCOME_ERROR(logsys->applyLevelOverride("nosuchgroup=debug"),
                       LogError::UNKNOWN_GROUP);
  ASSERT_OUTCOME_ERROR(logsys->applyLevelOverride("crypto=loud"),
                       LogError::UNKNOWN_LEVEL);
  ASSERT_OUTCOME_ERROR(logsys->applyLevelOverride("loud"),
                       LogError::UNKNOWN_LEVEL);
}

/**
 * @given mixed list of good and bad `-l` values
 * @when logging system is tuned with it
 * @then good values are applied and bad ones are skipped
 */
TEST_F(LevelOverrideTest, TuneSkipsBadChunks) {
  logsys->tuneLoggingSystem({"nosuchgroup=debug", "cli=loud", "cli=error"});

  auto logger = logsys->getLogger("TuneSkipsBadChunks", "cli");
  EXPECT_EQ(logger->level(), Level::ERROR);
}
