///
/// @file Level.cpp
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

#include "Level.hpp"

#include "src/core/common/TbExceptions.hpp"
#include "src/core/common/util.hpp"

namespace tb {
namespace tracing {

char const *toString(Level const level) TB_NOEXCEPT {
  switch (level) {
  case Level::Trace:
    return "TRACE";
  case Level::Debug:
    return "DEBUG";
  case Level::Info:
    return "INFO";
  case Level::Warn:
    return "WARN";
  case Level::Error:
    return "ERROR";
  default:
    UNREACHABLE(return "", "unknown level")
  }
}

Level parseLevel(std::string_view const name) {
  constexpr std::array<Level, 5U> levels{Level::Trace, Level::Debug, Level::Info, Level::Warn, Level::Error};
  for (Level const level : levels) {
    if (equalsIgnoreCase(name, toString(level))) {
      return level;
    }
  }
  throw RuntimeError(ErrorCode::Invalid_level_name);
}

} // namespace tracing
} // namespace tb
