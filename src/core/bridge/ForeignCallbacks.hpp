///
/// @file ForeignCallbacks.hpp
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
#ifndef SRC_CORE_BRIDGE_FOREIGNCALLBACKS_HPP
#define SRC_CORE_BRIDGE_FOREIGNCALLBACKS_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <pybind11/pybind11.h>

#include "ForeignObject.hpp"

namespace tb {
namespace bridge {

///
/// @brief Handler methods of a foreign layer object, resolved once
///
/// Each method is looked up by name when the set is created. A method which is missing, or whose lookup raises, stays absent for
/// the lifetime of the set.
///
class ForeignCallbacks final {
public:
  /// @brief bridged layer hooks
  enum class Hook : uint8_t { OnEvent, OnNewSpan, OnClose, OnRecord };
  /// @brief number of hooks
  static constexpr size_t HookCount{4U};

  ///
  /// @brief look up all handler methods on @p impl
  /// @note requires the GIL
  ///
  explicit ForeignCallbacks(pybind11::handle impl);

  /// @brief the resolved method, nullptr if it is absent
  ForeignObject const *get(Hook const hook) const noexcept {
    return methods_[static_cast<size_t>(hook)].get();
  }
  /// @brief whether the method is present
  bool has(Hook const hook) const noexcept {
    return get(hook) != nullptr;
  }
  /// @brief python name of the method
  static char const *getName(Hook const hook) noexcept;

private:
  std::array<std::unique_ptr<ForeignObject>, HookCount> methods_; ///< resolved methods indexed by Hook
};

} // namespace bridge
} // namespace tb

#endif // SRC_CORE_BRIDGE_FOREIGNCALLBACKS_HPP
