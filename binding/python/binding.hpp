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

#ifndef BINDING_PYTHON_BINDING_HPP
#define BINDING_PYTHON_BINDING_HPP

#include <pybind11/pybind11.h>

namespace tb {
namespace binding {

extern void bindingTracing(pybind11::module_ &m);
extern void bindingDemo(pybind11::module_ &m);

///
/// @brief install a registry forwarding to the python layer @p impl as process wide default
/// @note diagnostics and the level filter are configured through TRACEBRIDGE_LOG and TRACEBRIDGE_MAX_LEVEL
///
void initializeTracing(pybind11::object const &impl);

} // namespace binding
} // namespace tb

#endif // BINDING_PYTHON_BINDING_HPP
