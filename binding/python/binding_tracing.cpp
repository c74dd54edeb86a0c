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

#include <memory>
#include <pybind11/pybind11.h>
#include <utility>

#include "binding/python/binding.hpp"

#include "src/core/bridge/PythonCallbackLayer.hpp"
#include "src/core/common/ILogger.hpp"
#include "src/core/tracing/Dispatch.hpp"
#include "src/core/tracing/Registry.hpp"
#include "src/utils/EnvConfig.hpp"

namespace tb {

void binding::initializeTracing(pybind11::object const &impl) {
  // shared by every layer created here, it lives until process exit
  static std::unique_ptr<ILogger> const logger{config::createLoggerFromEnv()};

  std::shared_ptr<tracing::Registry> registry{std::make_shared<tracing::Registry>(config::getMaxLevelFromEnv())};
  registry->with(std::make_unique<bridge::PythonCallbackLayer>(impl, logger.get()));
  tracing::dispatch::setGlobalDefault(std::move(registry));
}

void binding::bindingTracing(pybind11::module_ &m) {
  m.def("initialize_tracing", &initializeTracing, pybind11::arg("py_impl"),
        "Forward spans and events of this module to py_impl, an object with any of the methods on_new_span(span_attrs, span_id), "
        "on_record(span_id, values, state), on_event(event, state) and on_close(span_id, state).");
}

} // namespace tb
