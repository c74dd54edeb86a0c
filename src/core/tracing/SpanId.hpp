///
/// @file SpanId.hpp
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
#ifndef SRC_CORE_TRACING_SPANID_HPP
#define SRC_CORE_TRACING_SPANID_HPP

#include <cstddef>
#include <cstdint>
#include <functional>

#include "src/config.hpp"

namespace tb {
namespace tracing {

///
/// @brief Identifier of a span, unique within its registry and never 0
///
class SpanId final {
public:
  /// @brief constructor
  explicit SpanId(uint64_t const value) TB_NOEXCEPT : value_(value) {
  }
  /// @brief see @b value_
  uint64_t getValue() const TB_NOEXCEPT {
    return value_;
  }
  bool operator==(SpanId const &other) const TB_NOEXCEPT {
    return value_ == other.value_;
  }
  bool operator!=(SpanId const &other) const TB_NOEXCEPT {
    return value_ != other.value_;
  }

private:
  uint64_t value_; ///< numeric id
};

} // namespace tracing
} // namespace tb

template <> struct std::hash<tb::tracing::SpanId> {
  size_t operator()(tb::tracing::SpanId const &id) const noexcept {
    return std::hash<uint64_t>{}(id.getValue());
  }
};

#endif // SRC_CORE_TRACING_SPANID_HPP
