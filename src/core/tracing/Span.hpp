///
/// @file Span.hpp
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
#ifndef SRC_CORE_TRACING_SPAN_HPP
#define SRC_CORE_TRACING_SPAN_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "Attributes.hpp"
#include "FieldValue.hpp"
#include "Level.hpp"
#include "Metadata.hpp"
#include "Registry.hpp"
#include "SpanId.hpp"

namespace tb {
namespace tracing {

///
/// @brief Source location and level of an instrumentation point, see Macros.hpp
///
struct Callsite final {
  char const *target; ///< producing component
  Level level;        ///< verbosity
  char const *file;   ///< source file
  uint32_t line;      ///< source line
};

///
/// @brief Handle of a span
///
/// Every handle holds one reference of the span, copying a handle clones the span and destroying it drops the reference. The
/// span closes when its last handle is gone and all of its children are closed. A default constructed handle refers to no span
/// and ignores every operation.
///
class Span final {
public:
  ///
  /// @brief Guard which keeps the span entered on the current thread
  ///
  class Entered final {
  public:
    Entered(std::shared_ptr<Registry> registry, std::optional<SpanId> const id);
    ~Entered() noexcept;
    Entered(Entered const &) = delete;
    Entered(Entered &&) = delete;
    Entered &operator=(Entered const &) = delete;
    Entered &operator=(Entered &&) = delete;

  private:
    std::shared_ptr<Registry> registry_; ///< registry of the span
    std::optional<SpanId> id_;           ///< entered span
  };

  /// @brief handle referring to no span
  Span() noexcept = default;
  ~Span() noexcept;
  Span(Span const &other);
  Span(Span &&other) noexcept;
  Span &operator=(Span const &other);
  Span &operator=(Span &&other) noexcept;

  ///
  /// @brief create a span in the current registry
  ///
  /// @param metadata callsite description
  /// @param values values present at creation
  /// @param parent parent selection
  /// @return Span handle, referring to no span if no registry is installed or the level is disabled
  static Span create(Metadata const &metadata, ValueSet const &values, Parent const parent = Parent::contextual());

  ///
  /// @brief create a span from a callsite, used by the TB_*_SPAN macros
  ///
  /// @param callsite location and level
  /// @param name span name
  /// @param values values present at creation, each of them is declared as a field
  /// @param emptyFields additionally declared fields which are recorded later
  /// @param parent parent selection
  static Span create(Callsite const &callsite, std::string name, ValueSet const &values = {}, std::vector<std::string> const &emptyFields = {},
                     Parent const parent = Parent::contextual());

  /// @brief handle of the innermost span entered on the current thread
  static Span current();

  /// @brief enter the span on the current thread until the guard is destroyed
  Entered enter() const;

  /// @brief run @p fn with the span entered
  template <class Fn> decltype(auto) inScope(Fn &&fn) const {
    Entered const entered = enter();
    return std::forward<Fn>(fn)();
  }

  ///
  /// @brief record a value of a declared field
  /// @note values of fields the span does not declare are dropped
  ///
  Span const &record(std::string const &field, FieldValue value) const;

  /// @brief whether the handle refers to no span
  bool isNone() const noexcept {
    return !id_.has_value();
  }
  /// @brief id of the span, empty for none
  std::optional<SpanId> const &getId() const noexcept {
    return id_;
  }
  /// @brief metadata of the span, nullptr for none
  Metadata const *getMetadata() const noexcept {
    return metadata_.get();
  }

private:
  Span(std::shared_ptr<Registry> registry, SpanId const id, std::shared_ptr<Metadata const> metadata) noexcept;
  void release() noexcept;

  std::shared_ptr<Registry> registry_;       ///< registry owning the span
  std::optional<SpanId> id_;                 ///< referenced span
  std::shared_ptr<Metadata const> metadata_; ///< metadata of the span
};

///
/// @brief dispatch an event to the current registry
///
/// @param metadata callsite description
/// @param values event fields including the message
/// @param parent parent selection
void emitEvent(Metadata const &metadata, ValueSet const &values, Parent const parent = Parent::contextual());

///
/// @brief dispatch an event from a callsite, used by the TB_* event macros
///
/// @param callsite location and level
/// @param message human readable message, recorded as field "message"
/// @param fields additional fields
/// @param parent parent selection
void emitEvent(Callsite const &callsite, std::string message, ValueSet const &fields = {}, Parent const parent = Parent::contextual());

/// @brief see emitEvent(Callsite const &, std::string, ValueSet const &, Parent const), with the parent first
inline void emitEvent(Parent const parent, Callsite const &callsite, std::string message, ValueSet const &fields = {}) {
  emitEvent(callsite, std::move(message), fields, parent);
}

/// @brief parent selection for an event or span created inside @p span, root if @p span refers to no span
Parent parentOf(Span const &span) noexcept;

} // namespace tracing
} // namespace tb

#endif // SRC_CORE_TRACING_SPAN_HPP
