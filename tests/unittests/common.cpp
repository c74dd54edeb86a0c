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
#include <pybind11/eval.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <string>
#include <utility>

#include "common.hpp"

#include "src/core/bridge/PythonCallbackLayer.hpp"

namespace tb {
namespace test {

char const *const recordingLayerScript = R"(
import threading

class RecordingLayer:
    def __init__(self):
        self.lock = threading.Lock()
        self.calls = []
        self.next_state = 0

    def on_new_span(self, span_attrs, span_id):
        with self.lock:
            state = self.next_state
            self.next_state += 1
            self.calls.append(("on_new_span", [span_attrs, span_id], None))
        return state

    def on_record(self, span_id, values, state):
        with self.lock:
            self.calls.append(("on_record", [span_id, values], state))

    def on_event(self, event, state):
        with self.lock:
            self.calls.append(("on_event", [event], state))

    def on_close(self, span_id, state):
        with self.lock:
            self.calls.append(("on_close", [span_id], state))

def make_recording_layer(removed):
    if not removed:
        return RecordingLayer()
    attrs = {name: value for name, value in RecordingLayer.__dict__.items() if name not in removed and name not in ("__dict__", "__weakref__")}
    return type("PartialRecordingLayer", (object,), attrs)()
)";

namespace {
pybind11::dict execScript(char const *const script) {
  pybind11::dict globals{};
  globals["__builtins__"] = pybind11::module_::import("builtins");
  pybind11::exec(script, globals);
  return globals;
}
} // namespace

pybind11::object createPythonObject(char const *const script, char const *const className) {
  return execScript(script)[className]();
}

pybind11::object createRecordingLayer(std::vector<std::string> const &removedMethods) {
  return execScript(recordingLayerScript)["make_recording_layer"](pybind11::cast(removedMethods));
}

std::vector<HookCall> getCalls(pybind11::handle recorder) {
  std::vector<HookCall> calls{};
  pybind11::list const recorded{recorder.attr("calls")};
  for (pybind11::handle const entry : recorded) {
    pybind11::tuple const call{pybind11::reinterpret_borrow<pybind11::tuple>(entry)};
    HookCall hookCall{call[0].cast<std::string>(), {}, std::nullopt};
    for (pybind11::handle const arg : call[1]) {
      hookCall.args.push_back(nlohmann::json::parse(arg.cast<std::string>()));
    }
    if (!call[2].is_none()) {
      hookCall.state = call[2].cast<int64_t>();
    }
    calls.push_back(std::move(hookCall));
  }
  return calls;
}

std::shared_ptr<tracing::Registry> createBridgeRegistry(pybind11::handle impl, ILogger *const logger, tracing::Level const maxVerbosity) {
  std::shared_ptr<tracing::Registry> registry{std::make_shared<tracing::Registry>(maxVerbosity)};
  registry->with(std::make_unique<bridge::PythonCallbackLayer>(impl, logger));
  return registry;
}

} // namespace test
} // namespace tb
