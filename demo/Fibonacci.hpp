///
/// @file Fibonacci.hpp
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
#ifndef DEMO_FIBONACCI_HPP
#define DEMO_FIBONACCI_HPP

#include <cstdint>

namespace tb {
namespace demo {

/// @brief Largest index the naive generator accepts
constexpr uint64_t MaxNaiveIndex{15U};

/// @brief recursive fibonacci number, one span per call
uint64_t naiveFibonacci(uint64_t const index);
/// @brief iterative fibonacci number
uint64_t memoizedFibonacci(uint64_t const index);

///
/// @brief instrumented fibonacci number, records the chosen generator in the "version" field of its span
/// @throws std::runtime_error if the naive generator is selected with an index above MaxNaiveIndex
///
uint64_t fibonacci(uint64_t const index, bool const useMemoized);

} // namespace demo
} // namespace tb

#endif // DEMO_FIBONACCI_HPP
