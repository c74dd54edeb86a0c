///
/// @file TbExceptions.cpp
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
#include "TbExceptions.hpp"

#include "src/config.hpp"
#include "src/core/common/util.hpp"

namespace tb {
RuntimeError::operator const char *() const TB_NOEXCEPT {
  switch (code_) {
  case (Code::Serialization_failed): {
    return "Serialization of tracing data to JSON failed";
  }
  case (Code::Extension_already_present): {
    return "Span extensions already contain a value of this type";
  }
  case (Code::Global_default_already_set): {
    return "A global default registry has already been set";
  }
  case (Code::Invalid_level_name): {
    return "Invalid tracing level name";
  }
  case (Code::Invalid_log_level_name): {
    return "Invalid log level name";
  }
  case (Code::Python_interpreter_not_initialized): {
    return "Python interpreter is not initialized";
  }
  default: {
    UNREACHABLE(return "Unknown error", "unknown error code")
  }
  }
}
} // namespace tb
