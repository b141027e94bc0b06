/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using sealbox::log::Error;
using sealbox::log::Level;
using sealbox::log::str2lvl;
using sealbox::log::tuneLoggingSystem;

class LoggerTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }
};

/**
 * @given full and short level names
 * @when parsed
 * @then they map to the same soralog levels, unknown names fail
 */
TEST_F(LoggerTest, LevelNames) {
  EXPECT_OUTCOME_TRUE(warn, str2lvl("warn"));
  EXPECT_EQ(warn, Level::WARN);
  EXPECT_OUTCOME_TRUE(warning, str2lvl("warning"));
  EXPECT_EQ(warning, Level::WARN);
  EXPECT_OUTCOME_TRUE(off, str2lvl("no"));
  EXPECT_EQ(off, Level::OFF);
  EXPECT_EC(str2lvl("loud"), Error::WRONG_LEVEL);
}

/**
 * @given a bare level and a group override
 * @when applied to the logging system
 * @then a logger of that group gets the overridden level
 */
TEST_F(LoggerTest, TuneGroups) {
  EXPECT_OUTCOME_TRUE_1(tuneLoggingSystem({"info", "runtime=trace"}));
  auto logger = sealbox::log::createLogger("LoggerTest", "runtime");
  EXPECT_EQ(logger->level(), Level::TRACE);
  EXPECT_OUTCOME_TRUE_1(tuneLoggingSystem({"runtime=info"}));
  EXPECT_EQ(logger->level(), Level::INFO);
}

/**
 * @given overrides naming an unknown group or level
 * @when applied
 * @then the matching error is returned
 */
TEST_F(LoggerTest, TuneRejectsUnknown) {
  EXPECT_EC(tuneLoggingSystem({"nosuchgroup=debug"}), Error::WRONG_GROUP);
  EXPECT_EC(tuneLoggingSystem({"runtime=loud"}), Error::WRONG_LEVEL);
}
