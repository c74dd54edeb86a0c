///
/// @file Context.hpp
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
#ifndef SRC_CORE_TRACING_CONTEXT_HPP
#define SRC_CORE_TRACING_CONTEXT_HPP

#include <optional>

#include "SpanId.hpp"
#include "SpanRef.hpp"

namespace tb {
namespace tracing {

class Registry;

///
/// @brief Span lookup handed to layer hooks
///
class Context final {
public:
  /// @brief constructor
  explicit Context(Registry const &registry) noexcept : registry_(registry) {
  }

  /// @brief the span with id @p id, empty if it is closed or unknown
  std::optional<SpanRef> span(SpanId const &id) const;
  /// @brief the innermost span entered on the calling thread which is still open
  std::optional<SpanRef> lookupCurrent() const;

private:
  Registry const &registry_;
};

} // namespace tracing
} // namespace tb

#endif // SRC_CORE_TRACING_CONTEXT_HPP
