///
/// @file TbExceptions.hpp
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
#ifndef CUSTOMEXCEPTIONS_HPP
#define CUSTOMEXCEPTIONS_HPP

#include <cstdint>
#include <exception>

#include "src/config.hpp"

namespace tb {
///
/// @brief Runtime error without dynamic memory allocation
///
class RuntimeError : public std::exception {
public:
  ///
  /// @brief Definition of error codes
  ///
  enum class Code : uint16_t {
    Serialization_failed,
    Extension_already_present,
    Global_default_already_set,
    Invalid_level_name,
    Invalid_log_level_name,
    Python_interpreter_not_initialized,
  };

  ///
  /// @brief type covert to const char*
  /// @return error message
  ///
  explicit operator const char *() const TB_NOEXCEPT;
  ///
  /// @brief construct a RuntimeError
  /// @param code the internal code
  ///
  // NOLINTNEXTLINE(readability-redundant-member-init)
  inline explicit RuntimeError(Code const code) TB_NOEXCEPT : std::exception(), code_(code) {
  }

  ///
  /// @brief Default copy constructor
  ///
  RuntimeError(const RuntimeError &) = default;
  ///
  /// @brief Default move constructor
  ///
  RuntimeError(RuntimeError &&) = default;
  ///
  /// @brief Default copy operator
  ///
  RuntimeError &operator=(const RuntimeError &) & = default;
  ///
  /// @brief Default move operator
  ///
  RuntimeError &operator=(RuntimeError &&) &TB_NOEXCEPT = default;
  ///
  /// @brief Default destructor
  ///
  ~RuntimeError() TB_NOEXCEPT override = default;

  ///
  /// @brief get error message of current error code
  /// @return error message
  ///
  inline const char *what() const noexcept override {
    return static_cast<const char *>(*this);
  }

  ///
  /// @brief get the internal error code
  /// @return error code
  ///
  inline Code getCode() const TB_NOEXCEPT {
    return code_;
  }

private:
  Code code_; ///< The internal error code
};

/// @brief All errors in tracebridge
using ErrorCode = RuntimeError::Code;

} // namespace tb

#endif
