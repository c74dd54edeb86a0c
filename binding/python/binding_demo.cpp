/*
 * Copyright (C) 2025 Bayerische Motoren Werke Aktiengesellschaft (BMW AG)
 * SPDX-License-Identifier: Apache-2.0
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <cstdint>
#include <pybind11/pybind11.h>

#include "binding/python/binding.hpp"
#include "demo/Fibonacci.hpp"

namespace tb {

void binding::bindingDemo(pybind11::module_ &m) {
  m.def("fibonacci", &demo::fibonacci, pybind11::arg("index"), pybind11::arg("use_memoized"),
        pybind11::call_guard<pybind11::gil_scoped_release>(), "Instrumented fibonacci number, raises RuntimeError for a naive index above 15.");
}

} // namespace tb
