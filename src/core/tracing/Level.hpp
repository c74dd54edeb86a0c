///
/// @file Level.hpp
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
#ifndef SRC_CORE_TRACING_LEVEL_HPP
#define SRC_CORE_TRACING_LEVEL_HPP

#include <cstdint>
#include <string_view>

#include "src/config.hpp"

namespace tb {
namespace tracing {

///
/// @brief Verbosity of a span or event, ordered from most to least verbose
///
enum class Level : uint8_t { Trace, Debug, Info, Warn, Error };

///
/// @brief Name of the level as it appears in serialized metadata
///
/// @param level Level to convert
/// @return char const* One of TRACE, DEBUG, INFO, WARN, ERROR
char const *toString(Level const level) TB_NOEXCEPT;

///
/// @brief Parse a level name, ignoring case
///
/// @param name Level name
/// @return Level Parsed level
/// @throws RuntimeError Invalid_level_name if name is not a level
Level parseLevel(std::string_view const name);

///
/// @brief Whether something at @p level passes a filter allowing everything up to @p maxVerbosity
///
inline bool isEnabledBy(Level const level, Level const maxVerbosity) TB_NOEXCEPT {
  return static_cast<uint8_t>(level) >= static_cast<uint8_t>(maxVerbosity);
}

} // namespace tracing
} // namespace tb

#endif // SRC_CORE_TRACING_LEVEL_HPP
