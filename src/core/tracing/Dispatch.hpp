///
/// @file Dispatch.hpp
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
#ifndef SRC_CORE_TRACING_DISPATCH_HPP
#define SRC_CORE_TRACING_DISPATCH_HPP

#include <memory>

#include "Registry.hpp"

namespace tb {
namespace tracing {
namespace dispatch {

///
/// @brief install the registry used by every thread without a scoped default
/// @throws RuntimeError Global_default_already_set if called more than once
///
void setGlobalDefault(std::shared_ptr<Registry> registry);

/// @brief whether setGlobalDefault has been called
bool hasGlobalDefault() noexcept;

///
/// @brief registry instrumentation on the calling thread reports to
/// @return the scoped default, else the global default, else nullptr
///
std::shared_ptr<Registry> getCurrent();

///
/// @brief restores the previous scoped default of the thread on destruction
///
class DefaultGuard final {
public:
  /// @brief constructor
  explicit DefaultGuard(std::shared_ptr<Registry> previous) noexcept : previous_(std::move(previous)) {
  }
  ~DefaultGuard() noexcept;
  DefaultGuard(DefaultGuard const &) = delete;
  DefaultGuard(DefaultGuard &&) = delete;
  DefaultGuard &operator=(DefaultGuard const &) = delete;
  DefaultGuard &operator=(DefaultGuard &&) = delete;

private:
  std::shared_ptr<Registry> previous_; ///< scoped default before this guard
};

///
/// @brief use @p registry on the calling thread until the returned guard is destroyed
///
DefaultGuard setDefault(std::shared_ptr<Registry> registry);

} // namespace dispatch
} // namespace tracing
} // namespace tb

#endif // SRC_CORE_TRACING_DISPATCH_HPP
