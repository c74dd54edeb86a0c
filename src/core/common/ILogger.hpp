///
/// @file ILogger.hpp
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
#ifndef ILOGGER_HPP
#define ILOGGER_HPP

#include <cstdint>
#include <string>

namespace tb {

///
/// @brief Different log levels
///
enum class LogLevel : uint8_t { LOGERROR, LOGWARNING, LOGINFO, LOGDEBUG, LOGVERBOSE };

///
/// @brief Diagnostic logger interface with placeholder implementation
///
/// A statement is streamed piece by piece and finished with tb::endStatement<level>, the base class discards everything.
/// Implementations called from several threads must keep the pieces of concurrent statements apart.
///
class ILogger {
public:
  ILogger() = default;
  ILogger(const ILogger &) = default;
  ILogger(ILogger &&) = default;
  ILogger &operator=(const ILogger &) & = default;
  ILogger &operator=(ILogger &&) & = default;
  virtual ~ILogger() = default;

  ///
  /// @brief Logs a string
  ///
  /// @param message String to log
  /// @return const ILogger& Returns a reference to the logger instance
  inline virtual ILogger &operator<<(char const *const message) {
    static_cast<void>(message);
    return *this;
  }

  ///
  /// @brief Logs a string
  ///
  /// @param message String to log
  /// @return const ILogger& Returns a reference to the logger instance
  inline virtual ILogger &operator<<(std::string const &message) {
    static_cast<void>(message);
    return *this;
  }

  ///
  /// @brief Logs an integer
  ///
  /// @param value Integer to log
  /// @return const ILogger& Returns a reference to the logger instance
  inline virtual ILogger &operator<<(uint64_t const value) {
    static_cast<void>(value);
    return *this;
  }

  ///
  /// @brief Allows usage of tb::endStatement
  ///
  /// @param fnc Function to be executed with the corresponding ILogger
  /// @return ILogger&
  inline virtual ILogger &operator<<(ILogger &(*fnc)(ILogger &logger)) {
    return fnc(*this);
  }

  ///
  /// @brief Mark this statement as finished
  ///
  /// @param level Log level
  ///
  inline virtual void endStatement(const LogLevel level) {
    static_cast<void>(level);
  }
};

///
/// @brief Helper function to use inline analogous to std::endl and std::flush
///
/// @tparam level Level at which to log
/// @param logger Reference to the logger
/// @return ILogger&
///
template <LogLevel level = LogLevel::LOGINFO> inline ILogger &endStatement(ILogger &logger) {
  logger.endStatement(level);
  return logger;
}

} // namespace tb
#endif
