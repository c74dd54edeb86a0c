///
/// @file EnvConfig.hpp
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
#ifndef SRC_UTILS_ENVCONFIG_HPP
#define SRC_UTILS_ENVCONFIG_HPP

#include <memory>
#include <optional>
#include <string_view>

#include "src/core/common/ILogger.hpp"
#include "src/core/tracing/Level.hpp"

namespace tb {
namespace config {

///
/// @brief Parse a diagnostic log level name (error, warning, info, debug, verbose), ignoring case
/// @throws RuntimeError Invalid_log_level_name for any other name
///
LogLevel parseLogLevel(std::string_view const name);

/// @brief diagnostic log level selected by TB_LOG_ENV, empty if unset
std::optional<LogLevel> getLogLevelFromEnv();

/// @brief most verbose tracing level selected by TB_MAX_LEVEL_ENV, Trace if unset
tracing::Level getMaxLevelFromEnv();

/// @brief logger writing to std::cerr at the level selected by TB_LOG_ENV, nullptr if unset
std::unique_ptr<ILogger> createLoggerFromEnv();

} // namespace config
} // namespace tb

#endif // SRC_UTILS_ENVCONFIG_HPP
