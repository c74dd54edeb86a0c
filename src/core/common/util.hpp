///
/// @file util.hpp
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
#ifndef COREUTIL_HPP
#define COREUTIL_HPP

#include <string_view>

#include "src/config.hpp"

#if (defined __GNUC__)
#define TB_GCC
#endif

#ifndef UNREACHABLE
#ifdef _MSC_VER
#define UNREACHABLE(STMT, COMMENT) __assume(0);
#elif (defined TB_GCC) || (defined __clang__)
#define UNREACHABLE(STMT, COMMENT) __builtin_unreachable();
#else
static_assert(false, "C/C++ compiler not supported");
#endif
#endif

namespace tb {

///
/// @brief Compare two strings ignoring ASCII case
///
/// @param lhs First string
/// @param rhs Second string
/// @return bool Whether both strings are equal ignoring case
bool equalsIgnoreCase(std::string_view const lhs, std::string_view const rhs) TB_NOEXCEPT;

} // namespace tb

#endif
