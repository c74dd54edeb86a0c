///
/// @file EnvConfig.cpp
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
#include <array>
#include <cstdlib>
#include <utility>

#include "EnvConfig.hpp"

#include "src/config.hpp"
#include "src/core/common/TbExceptions.hpp"
#include "src/core/common/util.hpp"
#include "src/utils/STDLogger.hpp"

namespace tb {
namespace config {

LogLevel parseLogLevel(std::string_view const name) {
  constexpr std::array<std::pair<char const *, LogLevel>, 5U> names{{
      {"error", LogLevel::LOGERROR},
      {"warning", LogLevel::LOGWARNING},
      {"info", LogLevel::LOGINFO},
      {"debug", LogLevel::LOGDEBUG},
      {"verbose", LogLevel::LOGVERBOSE},
  }};
  for (std::pair<char const *, LogLevel> const &entry : names) {
    if (equalsIgnoreCase(name, entry.first)) {
      return entry.second;
    }
  }
  throw RuntimeError(ErrorCode::Invalid_log_level_name);
}

std::optional<LogLevel> getLogLevelFromEnv() {
  char const *const value = std::getenv(TB_LOG_ENV);
  if (value == nullptr) {
    return std::nullopt;
  }
  return parseLogLevel(value);
}

tracing::Level getMaxLevelFromEnv() {
  char const *const value = std::getenv(TB_MAX_LEVEL_ENV);
  if (value == nullptr) {
    return tracing::Level::Trace;
  }
  return tracing::parseLevel(value);
}

std::unique_ptr<ILogger> createLoggerFromEnv() {
  std::optional<LogLevel> const level = getLogLevelFromEnv();
  if (!level.has_value()) {
    return nullptr;
  }
  return std::make_unique<STDLogger>(*level);
}

} // namespace config
} // namespace tb
