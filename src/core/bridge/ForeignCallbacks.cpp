///
/// @file ForeignCallbacks.cpp
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
#include <pybind11/pybind11.h>

#include "ForeignCallbacks.hpp"

#include "src/core/common/util.hpp"

namespace tb {
namespace bridge {

ForeignCallbacks::ForeignCallbacks(pybind11::handle impl) {
  for (size_t i = 0U; i < HookCount; i++) {
    // getattr with a default clears any error raised by the lookup
    pybind11::object method{pybind11::getattr(impl, getName(static_cast<Hook>(i)), pybind11::handle{})};
    if (method) {
      methods_[i] = std::make_unique<ForeignObject>(std::move(method));
    }
  }
}

char const *ForeignCallbacks::getName(Hook const hook) noexcept {
  switch (hook) {
  case Hook::OnEvent:
    return "on_event";
  case Hook::OnNewSpan:
    return "on_new_span";
  case Hook::OnClose:
    return "on_close";
  case Hook::OnRecord:
    return "on_record";
  default:
    UNREACHABLE(return "", "unknown hook")
  }
}

} // namespace bridge
} // namespace tb
