///
/// @file Layer.hpp
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
#ifndef SRC_CORE_TRACING_LAYER_HPP
#define SRC_CORE_TRACING_LAYER_HPP

#include "Attributes.hpp"
#include "SpanId.hpp"

namespace tb {
namespace tracing {

class Context;

///
/// @brief Observer of the span lifecycle, composed into a Registry
///
/// Hooks may be called concurrently from any thread. Every hook defaults to doing nothing.
///
class Layer {
public:
  /// @brief default constructor
  Layer() = default;
  /// @brief copy constructor
  Layer(Layer const &) = default;
  /// @brief move constructor
  Layer(Layer &&) = default;
  /// @brief copy operator
  Layer &operator=(Layer const &) & = default;
  /// @brief move operator
  Layer &operator=(Layer &&) & = default;
  /// @brief destructor
  virtual ~Layer() = default;

  ///
  /// @brief A span was created and is already resolvable through @p ctx
  ///
  /// @param attributes metadata and initial values of the span
  /// @param id id of the new span
  /// @param ctx lookup of spans
  virtual void onNewSpan(Attributes const &attributes, SpanId const &id, Context const &ctx) {
    static_cast<void>(attributes);
    static_cast<void>(id);
    static_cast<void>(ctx);
  }

  ///
  /// @brief Values were recorded on an existing span
  ///
  virtual void onRecord(SpanId const &id, Record const &values, Context const &ctx) {
    static_cast<void>(id);
    static_cast<void>(values);
    static_cast<void>(ctx);
  }

  ///
  /// @brief An event happened
  ///
  virtual void onEvent(Event const &event, Context const &ctx) {
    static_cast<void>(event);
    static_cast<void>(ctx);
  }

  /// @brief A thread entered the span
  virtual void onEnter(SpanId const &id, Context const &ctx) {
    static_cast<void>(id);
    static_cast<void>(ctx);
  }

  /// @brief A thread exited the span
  virtual void onExit(SpanId const &id, Context const &ctx) {
    static_cast<void>(id);
    static_cast<void>(ctx);
  }

  ///
  /// @brief The last handle of the span was dropped
  /// @note The span is still resolvable through @p ctx during this call and removed right after it.
  ///
  virtual void onClose(SpanId const &id, Context const &ctx) {
    static_cast<void>(id);
    static_cast<void>(ctx);
  }
};

} // namespace tracing
} // namespace tb

#endif // SRC_CORE_TRACING_LAYER_HPP
