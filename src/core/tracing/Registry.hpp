///
/// @file Registry.hpp
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
#ifndef SRC_CORE_TRACING_REGISTRY_HPP
#define SRC_CORE_TRACING_REGISTRY_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "Attributes.hpp"
#include "Layer.hpp"
#include "Level.hpp"
#include "SpanId.hpp"
#include "SpanRef.hpp"

namespace tb {
namespace tracing {

///
/// @brief Span registry and layer composition
///
/// It owns the data of every open span, tracks which spans each thread has entered and forwards the span lifecycle to its
/// layers in the order they were added.
///
/// Layers must be added before the registry is used. All other methods are thread-safe. No registry lock is held while a
/// layer hook runs.
///
class Registry final {
public:
  /// @brief Constructor, enables every level
  Registry();
  /// @brief Constructor
  /// @param maxVerbosity most verbose level which is enabled
  explicit Registry(Level const maxVerbosity);
  ~Registry() noexcept;
  Registry(Registry const &) = delete;
  Registry(Registry &&) = delete;
  Registry &operator=(Registry const &) = delete;
  Registry &operator=(Registry &&) = delete;

  /// @brief add a layer after all already added ones
  Registry &with(std::unique_ptr<Layer> layer);

  /// @brief whether spans and events at @p level produce anything
  bool isEnabled(Level const level) const noexcept {
    return isEnabledBy(level, maxVerbosity_);
  }

  ///
  /// @brief create a span holding one reference
  /// @note layers are notified before this function returns, if one of them throws the span is closed again, with onClose
  /// delivered only to the layers which completed onNewSpan, and the exception propagates
  ///
  SpanId newSpan(Attributes const &attributes);
  /// @brief record values on an open span, ignored for unknown ids
  void record(SpanId const &id, Record const &values);
  /// @brief dispatch an event to all layers
  void event(Event const &event);
  /// @brief mark the span as entered on the calling thread
  void enter(SpanId const &id);
  /// @brief undo the innermost enter of the span on the calling thread
  void exit(SpanId const &id);
  /// @brief add a reference to an open span
  void cloneSpan(SpanId const &id);
  ///
  /// @brief drop a reference to a span, closing it when it was the last one
  /// @return bool whether the span was closed
  ///
  bool tryClose(SpanId const &id);

  /// @brief see Context::span
  std::optional<SpanRef> span(SpanId const &id) const;
  /// @brief see Context::lookupCurrent
  std::optional<SpanRef> lookupCurrent() const;
  /// @brief id of the innermost span entered on the calling thread which is still open
  std::optional<SpanId> currentSpanId() const;
  /// @brief number of open spans
  size_t getOpenSpanCount() const;

private:
  using SpanStack = std::vector<SpanId>;

  /// @brief entered spans of the calling thread for this registry
  SpanStack &currentStack() const;
  /// @brief drop a reference, on the last one notify the first @p notifiedLayers layers and remove the span
  bool release(SpanId const &id, size_t const notifiedLayers);
  /// @brief add a reference on @p id unless it is already closing
  bool tryAcquire(SpanId const &id);

  uint64_t const serial_;                      ///< distinguishes registries in thread local state
  Level const maxVerbosity_;                   ///< level filter
  std::vector<std::unique_ptr<Layer>> layers_; ///< layers in notification order

  mutable std::shared_mutex spansMutex_;                           ///< guards @b spans_
  std::unordered_map<SpanId, std::shared_ptr<SpanData>> spans_; ///< open spans
  std::atomic<uint64_t> nextId_;                                   ///< next span id
};

} // namespace tracing
} // namespace tb

#endif // SRC_CORE_TRACING_REGISTRY_HPP
