///
/// @file Attributes.hpp
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
#ifndef SRC_CORE_TRACING_ATTRIBUTES_HPP
#define SRC_CORE_TRACING_ATTRIBUTES_HPP

#include <cstdint>
#include <optional>

#include "FieldValue.hpp"
#include "Metadata.hpp"
#include "SpanId.hpp"

#include "src/config.hpp"

namespace tb {
namespace tracing {

///
/// @brief How the parent of a new span or event is chosen
///
enum class ParentKind : uint8_t {
  Contextual, ///< the innermost span entered on the current thread, if any
  Explicit,   ///< a span given by id
  Root        ///< no parent
};

///
/// @brief Parent selection of a new span or event
///
class Parent final {
public:
  /// @brief use the span entered on the current thread
  static Parent contextual() TB_NOEXCEPT {
    return Parent{ParentKind::Contextual, std::nullopt};
  }
  /// @brief use the given span
  static Parent explicitly(SpanId const id) TB_NOEXCEPT {
    return Parent{ParentKind::Explicit, id};
  }
  /// @brief no parent at all
  static Parent root() TB_NOEXCEPT {
    return Parent{ParentKind::Root, std::nullopt};
  }

  ParentKind getKind() const TB_NOEXCEPT {
    return kind_;
  }
  /// @brief the explicit parent, empty unless kind is Explicit
  std::optional<SpanId> const &getId() const TB_NOEXCEPT {
    return id_;
  }

private:
  Parent(ParentKind const kind, std::optional<SpanId> const id) TB_NOEXCEPT : kind_(kind), id_(id) {
  }

  ParentKind kind_;           ///< selection mode
  std::optional<SpanId> id_;  ///< explicit parent id
};

///
/// @brief Everything known about a span when it is created
///
class Attributes final {
public:
  /// @brief constructor, all references must outlive this object
  Attributes(Metadata const &metadata, ValueSet const &values, Parent const parent) TB_NOEXCEPT
      : metadata_(metadata), values_(values), parent_(parent) {
  }

  Metadata const &getMetadata() const TB_NOEXCEPT {
    return metadata_;
  }
  /// @brief values present at creation, declared fields without a value are missing
  ValueSet const &getValues() const TB_NOEXCEPT {
    return values_;
  }
  /// @brief explicit parent, empty for contextual and root spans
  std::optional<SpanId> const &getParent() const TB_NOEXCEPT {
    return parent_.getId();
  }
  bool isRoot() const TB_NOEXCEPT {
    return parent_.getKind() == ParentKind::Root;
  }
  bool isContextual() const TB_NOEXCEPT {
    return parent_.getKind() == ParentKind::Contextual;
  }

private:
  Metadata const &metadata_;
  ValueSet const &values_;
  Parent parent_;
};

///
/// @brief Values recorded on an existing span
///
class Record final {
public:
  /// @brief constructor, @p values must outlive this object
  explicit Record(ValueSet const &values) TB_NOEXCEPT : values_(values) {
  }
  ValueSet const &getValues() const TB_NOEXCEPT {
    return values_;
  }
  bool isEmpty() const TB_NOEXCEPT {
    return values_.empty();
  }

private:
  ValueSet const &values_;
};

///
/// @brief A point in time record such as a log line
///
/// The human readable message is the field named "message".
///
class Event final {
public:
  /// @brief constructor, all references must outlive this object
  Event(Metadata const &metadata, ValueSet const &values, Parent const parent) TB_NOEXCEPT : metadata_(metadata), values_(values), parent_(parent) {
  }

  Metadata const &getMetadata() const TB_NOEXCEPT {
    return metadata_;
  }
  ValueSet const &getValues() const TB_NOEXCEPT {
    return values_;
  }
  /// @brief explicit parent, empty for contextual and root events
  std::optional<SpanId> const &getParent() const TB_NOEXCEPT {
    return parent_.getId();
  }
  bool isRoot() const TB_NOEXCEPT {
    return parent_.getKind() == ParentKind::Root;
  }
  bool isContextual() const TB_NOEXCEPT {
    return parent_.getKind() == ParentKind::Contextual;
  }

private:
  Metadata const &metadata_;
  ValueSet const &values_;
  Parent parent_;
};

} // namespace tracing
} // namespace tb

#endif // SRC_CORE_TRACING_ATTRIBUTES_HPP
