///
/// @file FieldValue.cpp
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
#include <cstdio>

#include "FieldValue.hpp"

namespace tb {
namespace tracing {

DebugValue debug(std::string_view const value) {
  std::string repr{};
  repr.reserve(value.size() + 2U);
  repr.push_back('"');
  for (char const c : value) {
    switch (c) {
    case '"':
      repr.append("\\\"");
      break;
    case '\\':
      repr.append("\\\\");
      break;
    case '\n':
      repr.append("\\n");
      break;
    case '\r':
      repr.append("\\r");
      break;
    case '\t':
      repr.append("\\t");
      break;
    case '\0':
      repr.append("\\0");
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20U) {
        std::array<char, 8U> escaped{};
        static_cast<void>(std::snprintf(escaped.data(), escaped.size(), "\\u{%x}", static_cast<unsigned int>(c)));
        repr.append(escaped.data());
      } else {
        repr.push_back(c);
      }
      break;
    }
  }
  repr.push_back('"');
  return DebugValue{std::move(repr)};
}

DebugValue debug(std::string const &value) {
  return debug(std::string_view{value});
}

DebugValue debug(char const *const value) {
  return debug(std::string_view{value});
}

} // namespace tracing
} // namespace tb
