///
/// @file Dispatch.cpp
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
#include <atomic>
#include <mutex>
#include <utility>

#include "Dispatch.hpp"

#include "src/core/common/TbExceptions.hpp"

namespace tb {
namespace tracing {
namespace dispatch {

namespace {
std::mutex globalMutex{};
// written once under globalMutex before isGlobalSet is published, read-only afterwards
std::shared_ptr<Registry> globalDefault{};
std::atomic<bool> isGlobalSet{false};

std::shared_ptr<Registry> &scopedDefault() {
  thread_local std::shared_ptr<Registry> registry{};
  return registry;
}
} // namespace

void setGlobalDefault(std::shared_ptr<Registry> registry) {
  std::lock_guard<std::mutex> const lock{globalMutex};
  if (isGlobalSet.load(std::memory_order_acquire)) {
    throw RuntimeError(ErrorCode::Global_default_already_set);
  }
  globalDefault = std::move(registry);
  isGlobalSet.store(true, std::memory_order_release);
}

bool hasGlobalDefault() noexcept {
  return isGlobalSet.load(std::memory_order_acquire);
}

std::shared_ptr<Registry> getCurrent() {
  std::shared_ptr<Registry> const &scoped = scopedDefault();
  if (scoped != nullptr) {
    return scoped;
  }
  if (isGlobalSet.load(std::memory_order_acquire)) {
    return globalDefault;
  }
  return nullptr;
}

DefaultGuard::~DefaultGuard() noexcept {
  scopedDefault() = std::move(previous_);
}

DefaultGuard setDefault(std::shared_ptr<Registry> registry) {
  std::shared_ptr<Registry> previous{std::exchange(scopedDefault(), std::move(registry))};
  return DefaultGuard{std::move(previous)};
}

} // namespace dispatch
} // namespace tracing
} // namespace tb
