///
/// @file Metadata.hpp
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
#ifndef SRC_CORE_TRACING_METADATA_HPP
#define SRC_CORE_TRACING_METADATA_HPP

#include <algorithm>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "Level.hpp"

#include "src/config.hpp"

namespace tb {
namespace tracing {

///
/// @brief Static description of the callsite a span or event was created at
///
class Metadata final {
public:
  /// @brief whether the callsite creates spans or events
  enum class Kind : uint8_t { Span, Event };

  ///
  /// @brief constructor
  /// @param name name of the span, or the event's description
  /// @param target module or component which produced the data
  /// @param level verbosity
  /// @param file source file of the callsite
  /// @param line source line of the callsite
  /// @param fields names of all fields the callsite declares, in declaration order
  /// @param kind span or event
  ///
  Metadata(std::string name, std::string target, Level const level, std::string file, uint32_t const line, std::vector<std::string> fields,
           Kind const kind)
      : name_(std::move(name)), target_(std::move(target)), level_(level), file_(std::move(file)), line_(line), fields_(std::move(fields)),
        kind_(kind) {
  }

  std::string const &getName() const TB_NOEXCEPT {
    return name_;
  }
  std::string const &getTarget() const TB_NOEXCEPT {
    return target_;
  }
  /// @brief module path of the callsite, C++ callsites use the target
  std::string const &getModulePath() const TB_NOEXCEPT {
    return target_;
  }
  Level getLevel() const TB_NOEXCEPT {
    return level_;
  }
  std::string const &getFile() const TB_NOEXCEPT {
    return file_;
  }
  uint32_t getLine() const TB_NOEXCEPT {
    return line_;
  }
  std::vector<std::string> const &getFields() const TB_NOEXCEPT {
    return fields_;
  }
  bool isSpan() const TB_NOEXCEPT {
    return kind_ == Kind::Span;
  }
  bool isEvent() const TB_NOEXCEPT {
    return kind_ == Kind::Event;
  }
  /// @brief whether the callsite declares a field with this name
  bool hasField(std::string const &field) const {
    return std::find(fields_.begin(), fields_.end(), field) != fields_.end();
  }

private:
  std::string name_;                ///< span name or event description
  std::string target_;              ///< producing component
  Level level_;                     ///< verbosity
  std::string file_;                ///< source file
  uint32_t line_;                   ///< source line
  std::vector<std::string> fields_; ///< declared field names
  Kind kind_;                       ///< span or event
};

} // namespace tracing
} // namespace tb

#endif // SRC_CORE_TRACING_METADATA_HPP
