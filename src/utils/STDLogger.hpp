///
/// @file STDLogger.hpp
/// @copyright Copyright (C) 2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
/// SPDX-License-Identifier: Apache-2.0
/// Licensed under the Apache License, Version 2.0 (the "License");
/// you may not use this file except in compliance with the License.
/// You may obtain a copy of the License at
///
///     http://www.apache.org/licenses/LICENSE-2.0
///
/// Unless required by applicable law or agreed to in writing, software
/// distributed under the License is distributed on an "AS IS" BASIS,
/// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
/// See the License for the specific language governing permissions and
/// limitations under the License.
///
#ifndef STD_LOGGER_HPP
#define STD_LOGGER_HPP

#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

#include "src/core/common/ILogger.hpp"

namespace tb {
///
/// @brief Log diagnostic messages to std::cerr
///
/// Parts of a statement are collected per thread and written as one line when the statement ends.
/// Statements more verbose than the configured level are dropped.
///
class STDLogger : public ILogger {
public:
  ///
  /// @brief Constructor
  ///
  /// @param maxLevel Most verbose level which is still written
  explicit STDLogger(LogLevel const maxLevel = LogLevel::LOGINFO) : maxLevel_(maxLevel) {
  }
  ///
  /// @brief Log const char*
  ///
  /// @param message
  /// @return const ILogger&
  ///
  inline ILogger &operator<<(char const *const message) override {
    currentStatement() << message;
    return *this;
  }
  ///
  /// @brief Log std::string
  ///
  /// @param message
  /// @return const ILogger&
  ///
  inline ILogger &operator<<(std::string const &message) override {
    currentStatement() << message;
    return *this;
  }
  ///
  /// @brief log integer
  ///
  /// @param value
  /// @return const ILogger&
  ///
  inline ILogger &operator<<(uint64_t const value) override {
    currentStatement() << value;
    return *this;
  }

  /// @brief The type of function which can be executed by ILogger
  using ILoggerFunc = ILogger &(*)(ILogger &logger);
  ///
  /// @brief Allows usage of tb::endStatement
  ///
  /// @param fnc Function to be executed with the corresponding ILogger
  /// @return ILogger&
  inline ILogger &operator<<(ILoggerFunc const fnc) override {
    return ILogger::operator<<(fnc);
  }

  ///
  /// @brief Mark this statement as finished
  ///
  /// @param level Log level
  ///
  inline void endStatement(LogLevel const level) override {
    std::ostringstream &statement = currentStatement();
    if (level <= maxLevel_) {
      std::lock_guard<std::mutex> const lock{writeMutex_};
      std::cerr << "[tracebridge " << getLevelName(level) << "] " << statement.str() << std::endl;
    }
    statement.str(std::string{});
  }

private:
  static std::ostringstream &currentStatement() {
    thread_local std::ostringstream statement{};
    return statement;
  }

  static char const *getLevelName(LogLevel const level) {
    switch (level) {
    case LogLevel::LOGERROR:
      return "error";
    case LogLevel::LOGWARNING:
      return "warning";
    case LogLevel::LOGINFO:
      return "info";
    case LogLevel::LOGDEBUG:
      return "debug";
    default:
      return "verbose";
    }
  }

  LogLevel maxLevel_;     ///< Most verbose level which is written
  std::mutex writeMutex_; ///< Serializes finished statements on std::cerr
};

} // namespace tb

#endif
