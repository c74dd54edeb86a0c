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

#ifndef TESTS_UNITTESTS_COMMON_HPP
#define TESTS_UNITTESTS_COMMON_HPP

#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <pybind11/pybind11.h>
#include <string>
#include <vector>

#include "src/core/common/ILogger.hpp"
#include "src/core/tracing/Level.hpp"
#include "src/core/tracing/Registry.hpp"

namespace tb {
namespace test {

///
/// @brief Python source of the class RecordingLayer
///
/// Every hook appends (method name, [json arguments], state) to self.calls. on_new_span returns consecutive integers
/// starting at 0 as span state. make_recording_layer(removed) instantiates a copy of the class without the listed methods.
///
extern char const *const recordingLayerScript;

///
/// @brief execute @p script in fresh globals and instantiate the class @p className defined by it
/// @note requires the GIL
///
pybind11::object createPythonObject(char const *const script, char const *const className);

/// @brief RecordingLayer instance without the methods in @p removedMethods, requires the GIL
pybind11::object createRecordingLayer(std::vector<std::string> const &removedMethods = {});

///
/// @brief One hook call observed by a RecordingLayer
///
struct HookCall final {
  std::string hook;                 ///< python method name
  std::vector<nlohmann::json> args; ///< decoded json arguments
  std::optional<int64_t> state;     ///< state argument, empty for None
};

/// @brief calls observed by a RecordingLayer, requires the GIL
std::vector<HookCall> getCalls(pybind11::handle recorder);

/// @brief registry with a single python bridge layer over @p impl
std::shared_ptr<tracing::Registry> createBridgeRegistry(pybind11::handle impl, ILogger *const logger = nullptr,
                                                        tracing::Level const maxVerbosity = tracing::Level::Trace);

} // namespace test
} // namespace tb

#endif // TESTS_UNITTESTS_COMMON_HPP
