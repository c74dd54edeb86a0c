///
/// @file Registry.cpp
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
#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <iterator>
#include <mutex>
#include <shared_mutex>
#include <utility>

#include "Context.hpp"
#include "Registry.hpp"

namespace tb {
namespace tracing {

namespace {
std::atomic<uint64_t> registrySerial{0U};
} // namespace

Registry::Registry() : Registry(Level::Trace) {
}

Registry::Registry(Level const maxVerbosity) : serial_(registrySerial.fetch_add(1U)), maxVerbosity_(maxVerbosity), nextId_(1U) {
}

Registry::~Registry() noexcept = default;

Registry &Registry::with(std::unique_ptr<Layer> layer) {
  layers_.push_back(std::move(layer));
  return *this;
}

namespace {
std::unordered_map<uint64_t, std::vector<SpanId>> &threadStacks() {
  thread_local std::unordered_map<uint64_t, std::vector<SpanId>> stacks{};
  return stacks;
}
} // namespace

Registry::SpanStack &Registry::currentStack() const {
  return threadStacks()[serial_];
}

bool Registry::tryAcquire(SpanId const &id) {
  std::shared_lock<std::shared_mutex> const lock{spansMutex_};
  auto const it = spans_.find(id);
  if (it == spans_.end()) {
    return false;
  }
  std::atomic<uint32_t> &refCount = it->second->refCount_;
  uint32_t count = refCount.load();
  while (count != 0U) {
    if (refCount.compare_exchange_weak(count, count + 1U)) {
      return true;
    }
  }
  return false;
}

SpanId Registry::newSpan(Attributes const &attributes) {
  std::optional<SpanId> parent{};
  if (attributes.getParent().has_value()) {
    parent = attributes.getParent();
  } else if (attributes.isContextual()) {
    parent = currentSpanId();
  }
  if (parent.has_value() && !tryAcquire(*parent)) {
    parent.reset();
  }

  SpanId const id{nextId_.fetch_add(1U)};
  std::shared_ptr<SpanData> data{std::make_shared<SpanData>(id, std::make_shared<Metadata const>(attributes.getMetadata()), parent)};
  {
    std::unique_lock<std::shared_mutex> const lock{spansMutex_};
    spans_.emplace(id, std::move(data));
  }

  Context const ctx{*this};
  size_t notifiedLayers{0U};
  try {
    for (std::unique_ptr<Layer> const &layer : layers_) {
      layer->onNewSpan(attributes, id, ctx);
      notifiedLayers++;
    }
  } catch (std::exception const &) {
    // the caller never receives a handle, only layers which completed onNewSpan see the close
    static_cast<void>(release(id, notifiedLayers));
    throw;
  }
  return id;
}

void Registry::record(SpanId const &id, Record const &values) {
  if (!span(id).has_value()) {
    return;
  }
  Context const ctx{*this};
  for (std::unique_ptr<Layer> const &layer : layers_) {
    layer->onRecord(id, values, ctx);
  }
}

void Registry::event(Event const &event) {
  if (!isEnabled(event.getMetadata().getLevel())) {
    return;
  }
  Context const ctx{*this};
  for (std::unique_ptr<Layer> const &layer : layers_) {
    layer->onEvent(event, ctx);
  }
}

void Registry::enter(SpanId const &id) {
  currentStack().push_back(id);
  Context const ctx{*this};
  for (std::unique_ptr<Layer> const &layer : layers_) {
    layer->onEnter(id, ctx);
  }
}

void Registry::exit(SpanId const &id) {
  SpanStack &stack = currentStack();
  auto const it = std::find(stack.rbegin(), stack.rend(), id);
  if (it != stack.rend()) {
    stack.erase(std::next(it).base());
  }
  if (stack.empty()) {
    threadStacks().erase(serial_);
  }
  Context const ctx{*this};
  for (std::unique_ptr<Layer> const &layer : layers_) {
    layer->onExit(id, ctx);
  }
}

void Registry::cloneSpan(SpanId const &id) {
  std::shared_lock<std::shared_mutex> const lock{spansMutex_};
  auto const it = spans_.find(id);
  if (it != spans_.end()) {
    it->second->refCount_.fetch_add(1U);
  }
}

bool Registry::tryClose(SpanId const &id) {
  return release(id, layers_.size());
}

bool Registry::release(SpanId const &id, size_t const notifiedLayers) {
  std::shared_ptr<SpanData> data{};
  {
    std::shared_lock<std::shared_mutex> const lock{spansMutex_};
    auto const it = spans_.find(id);
    if (it == spans_.end()) {
      return false;
    }
    data = it->second;
  }
  if (data->refCount_.fetch_sub(1U) != 1U) {
    return false;
  }

  // The span is removed even if a layer throws.
  struct Raii { // NOLINT(cppcoreguidelines-special-member-functions)
    Registry &registry_;
    SpanId const &id_;
    Raii(Registry &registry, SpanId const &id) : registry_(registry), id_(id) {
    }
    ~Raii() {
      std::shared_ptr<SpanData> removed{};
      {
        std::unique_lock<std::shared_mutex> const lock{registry_.spansMutex_};
        auto const it = registry_.spans_.find(id_);
        if (it != registry_.spans_.end()) {
          removed = std::move(it->second);
          registry_.spans_.erase(it);
        }
      }
      // extensions are destroyed here, outside of the registry lock
    }
  };
  {
    Raii const raii{*this, id};
    Context const ctx{*this};
    for (size_t i = 0U; i < notifiedLayers; i++) {
      layers_[i]->onClose(id, ctx);
    }
  }

  std::optional<SpanId> const parent = data->parent_;
  data.reset();
  if (parent.has_value()) {
    static_cast<void>(tryClose(*parent));
  }
  return true;
}

std::optional<SpanRef> Registry::span(SpanId const &id) const {
  std::shared_lock<std::shared_mutex> const lock{spansMutex_};
  auto const it = spans_.find(id);
  if (it == spans_.end()) {
    return std::nullopt;
  }
  return SpanRef{it->second};
}

std::optional<SpanId> Registry::currentSpanId() const {
  SpanStack const &stack = currentStack();
  for (auto it = stack.rbegin(); it != stack.rend(); ++it) {
    if (span(*it).has_value()) {
      return *it;
    }
  }
  return std::nullopt;
}

std::optional<SpanRef> Registry::lookupCurrent() const {
  SpanStack const &stack = currentStack();
  for (auto it = stack.rbegin(); it != stack.rend(); ++it) {
    std::optional<SpanRef> ref = span(*it);
    if (ref.has_value()) {
      return ref;
    }
  }
  return std::nullopt;
}

size_t Registry::getOpenSpanCount() const {
  std::shared_lock<std::shared_mutex> const lock{spansMutex_};
  return spans_.size();
}

std::optional<SpanRef> Context::span(SpanId const &id) const {
  return registry_.span(id);
}

std::optional<SpanRef> Context::lookupCurrent() const {
  return registry_.lookupCurrent();
}

} // namespace tracing
} // namespace tb
