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

#include <iostream>
#include <pybind11/embed.h>

#include "binding/python/binding.hpp"

PYBIND11_EMBEDDED_MODULE(tracebridge, m) {
  tb::binding::bindingTracing(m);
  tb::binding::bindingDemo(m);
}

static char const *const demoScript = R"(
import json
import tracebridge

class DemoTracingLayer:
    def on_new_span(self, span_attrs, span_id):
        attrs = json.loads(span_attrs)
        state = {"id": json.loads(span_id)[0], "name": attrs["metadata"]["name"]}
        print(f"new span {state['name']}: {span_attrs}")
        return state

    def on_record(self, span_id, values, state):
        print(f"record {span_id}: {values} (state {state})")

    def on_event(self, event, state):
        print(f"event: {event} (state {state})")

    def on_close(self, span_id, state):
        print(f"close {span_id} (state {state})")

tracebridge.initialize_tracing(DemoTracingLayer())

print("memoized fibonacci(10):", tracebridge.fibonacci(10, True))
print("naive fibonacci(10):", tracebridge.fibonacci(10, False))
try:
    tracebridge.fibonacci(30, False)
except RuntimeError as error:
    print("naive fibonacci(30) failed:", error)
)";

int main() {
  pybind11::scoped_interpreter const interpreter{};
  try {
    pybind11::exec(demoScript);
  } catch (pybind11::error_already_set const &error) {
    std::cerr << "demo failed: " << error.what() << std::endl;
    return 1;
  }
  return 0;
}
