///
/// @file Fibonacci.cpp
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
#include <stdexcept>
#include <string>
#include <vector>

#include "Fibonacci.hpp"

#include "src/core/tracing/Macros.hpp"

namespace tb {
namespace demo {

uint64_t naiveFibonacci(uint64_t const index) {
  tracing::Span const span = TB_INFO_SPAN("naive_fibonacci", {{"index", index}});
  tracing::Span::Entered const entered = span.enter();
  TB_DEBUG("Getting the " + std::to_string(index) + "th fibonacci number");
  if ((index == 0U) || (index == 1U)) {
    TB_TRACE("Base case: " + std::to_string(index));
    return 1U;
  }
  TB_TRACE("Calling recursively to get sum of " + std::to_string(index - 1U) + " and " + std::to_string(index - 2U));
  return naiveFibonacci(index - 1U) + naiveFibonacci(index - 2U);
}

uint64_t memoizedFibonacci(uint64_t const index) {
  tracing::Span const span = TB_INFO_SPAN("memoized_fibonacci", {{"index", index}});
  tracing::Span::Entered const entered = span.enter();
  TB_DEBUG("Getting the " + std::to_string(index) + "th fibonacci number");
  if ((index == 0U) || (index == 1U)) {
    TB_TRACE("Base case: " + std::to_string(index));
    return 1U;
  }
  std::vector<uint64_t> memo{1U, 1U};
  memo.reserve(index + 1U);
  for (uint64_t i = 2U; i <= index; i++) {
    TB_TRACE("Memoizing " + std::to_string(i) + " by adding " + std::to_string(i - 1U) + " and " + std::to_string(i - 2U));
    memo.push_back(memo[i - 1U] + memo[i - 2U]);
  }
  return memo[index];
}

uint64_t fibonacci(uint64_t const index, bool const useMemoized) {
  tracing::Span const span = TB_INFO_SPAN("fibonacci", {{"index", index}, {"use_memoized", useMemoized}}, {"version"});
  tracing::Span::Entered const entered = span.enter();
  if (useMemoized) {
    TB_INFO("Using memoized fibonacci generator");
    tracing::Span::current().record("version", "memoized");
    return memoizedFibonacci(index);
  }
  if (index <= MaxNaiveIndex) {
    TB_WARN("Warning: using the naive fibonacci generator");
    tracing::Span::current().record("version", "naive");
    return naiveFibonacci(index);
  }
  TB_ERROR("Error: using the naive fibonacci generator with too high an index: " + std::to_string(index));
  throw std::runtime_error("index too high for naive fibonacci generator");
}

} // namespace demo
} // namespace tb
