/*
 * Copyright (C) 2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
 * SPDX-License-Identifier: Apache-2.0
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <cstdlib>
#include <gtest/gtest.h>
#include <string>

#include "src/config.hpp"
#include "src/core/common/ILogger.hpp"
#include "src/core/common/TbExceptions.hpp"
#include "src/core/tracing/Level.hpp"
#include "src/utils/EnvConfig.hpp"

using tb::tracing::Level;

// NOLINTNEXTLINE(cert-err58-cpp, cppcoreguidelines-special-member-functions)
TEST(TestLevel, NamesRoundTrip) {
  EXPECT_STREQ(tb::tracing::toString(Level::Trace), "TRACE");
  EXPECT_STREQ(tb::tracing::toString(Level::Warn), "WARN");
  EXPECT_EQ(tb::tracing::parseLevel("error"), Level::Error);
  EXPECT_EQ(tb::tracing::parseLevel("Info"), Level::Info);
  EXPECT_EQ(tb::tracing::parseLevel("DEBUG"), Level::Debug);
}

// NOLINTNEXTLINE(cert-err58-cpp, cppcoreguidelines-special-member-functions)
TEST(TestLevel, UnknownNameThrows) {
  try {
    static_cast<void>(tb::tracing::parseLevel("warning"));
    FAIL() << "expected RuntimeError";
  } catch (tb::RuntimeError const &error) {
    EXPECT_EQ(error.getCode(), tb::ErrorCode::Invalid_level_name);
  }
}

// NOLINTNEXTLINE(cert-err58-cpp, cppcoreguidelines-special-member-functions)
TEST(TestLevel, Filter) {
  EXPECT_TRUE(tb::tracing::isEnabledBy(Level::Trace, Level::Trace));
  EXPECT_TRUE(tb::tracing::isEnabledBy(Level::Error, Level::Info));
  EXPECT_TRUE(tb::tracing::isEnabledBy(Level::Info, Level::Info));
  EXPECT_FALSE(tb::tracing::isEnabledBy(Level::Debug, Level::Info));
}

struct TestEnvConfig : public ::testing::Test {
  void TearDown() override {
    static_cast<void>(unsetenv(TB_LOG_ENV));
    static_cast<void>(unsetenv(TB_MAX_LEVEL_ENV));
  }
};

// NOLINTNEXTLINE(cert-err58-cpp, cppcoreguidelines-special-member-functions)
TEST_F(TestEnvConfig, DefaultsWhenUnset) {
  static_cast<void>(unsetenv(TB_LOG_ENV));
  static_cast<void>(unsetenv(TB_MAX_LEVEL_ENV));
  EXPECT_FALSE(tb::config::getLogLevelFromEnv().has_value());
  EXPECT_TRUE(tb::config::createLoggerFromEnv() == nullptr);
  EXPECT_EQ(tb::config::getMaxLevelFromEnv(), Level::Trace);
}

// NOLINTNEXTLINE(cert-err58-cpp, cppcoreguidelines-special-member-functions)
TEST_F(TestEnvConfig, ReadsVariables) {
  ASSERT_EQ(setenv(TB_LOG_ENV, "Warning", 1), 0);
  ASSERT_EQ(setenv(TB_MAX_LEVEL_ENV, "warn", 1), 0);
  EXPECT_TRUE(tb::config::getLogLevelFromEnv() == tb::LogLevel::LOGWARNING);
  EXPECT_TRUE(tb::config::createLoggerFromEnv() != nullptr);
  EXPECT_EQ(tb::config::getMaxLevelFromEnv(), Level::Warn);
}

// NOLINTNEXTLINE(cert-err58-cpp, cppcoreguidelines-special-member-functions)
TEST_F(TestEnvConfig, InvalidLogLevelThrows) {
  ASSERT_EQ(setenv(TB_LOG_ENV, "loud", 1), 0);
  EXPECT_THROW(static_cast<void>(tb::config::getLogLevelFromEnv()), tb::RuntimeError);
  EXPECT_EQ(tb::config::parseLogLevel("VERBOSE"), tb::LogLevel::LOGVERBOSE);
}
