///
/// @file PythonCallbackLayer.hpp
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
#ifndef SRC_CORE_BRIDGE_PYTHONCALLBACKLAYER_HPP
#define SRC_CORE_BRIDGE_PYTHONCALLBACKLAYER_HPP

#include <optional>
#include <pybind11/pybind11.h>

#include "ForeignCallbacks.hpp"
#include "ForeignObject.hpp"

#include "src/core/common/ILogger.hpp"
#include "src/core/tracing/Attributes.hpp"
#include "src/core/tracing/Context.hpp"
#include "src/core/tracing/Layer.hpp"
#include "src/core/tracing/SpanId.hpp"

namespace tb {
namespace bridge {

///
/// @brief Layer forwarding the span lifecycle to a python object
///
/// Every hook serializes its arguments as JSON strings and calls the method of the same name on the python object, if the object
/// has it:
/// - on_new_span(span_attrs: str, span_id: str) -> Any
/// - on_record(span_id: str, values: str, state: Any)
/// - on_event(event: str, state: Any)
/// - on_close(span_id: str, state: Any)
///
/// The value returned by on_new_span is attached to the span as SpanState and passed back as @b state to the later hooks of that
/// span, or of events inside it. on_close receives the state for the last time, the span no longer holds it afterwards. @b state is
/// None when there is no span or the span has no state.
///
/// The GIL is held only while a python method runs. Exceptions raised by the python methods are discarded, so a failing handler
/// never disturbs the instrumented code. The python object's methods are resolved once, in the constructor.
///
class PythonCallbackLayer final : public tracing::Layer {
public:
  ///
  /// @brief Constructor
  ///
  /// @param impl python object implementing any subset of the handler methods
  /// @param logger optional diagnostic logger, must outlive the layer
  /// @throws RuntimeError Python_interpreter_not_initialized if there is no interpreter
  explicit PythonCallbackLayer(pybind11::handle impl, ILogger *const logger = nullptr);

  void onEvent(tracing::Event const &event, tracing::Context const &ctx) override;
  void onNewSpan(tracing::Attributes const &attributes, tracing::SpanId const &id, tracing::Context const &ctx) override;
  void onClose(tracing::SpanId const &id, tracing::Context const &ctx) override;
  void onRecord(tracing::SpanId const &id, tracing::Record const &values, tracing::Context const &ctx) override;

  /// @brief resolved handler methods
  ForeignCallbacks const &getCallbacks() const noexcept {
    return callbacks_;
  }

private:
  ///
  /// @brief call a python handler, discarding any exception it raises
  /// @note requires the GIL
  /// @return result of the call, empty if it raised
  ///
  template <class... Args> std::optional<pybind11::object> invokeIsolated(ForeignCallbacks::Hook const hook, Args &&...args) const;

  ForeignCallbacks callbacks_; ///< resolved handler methods
  ILogger *logger_;            ///< diagnostic logger, may be nullptr
};

} // namespace bridge
} // namespace tb

#endif // SRC_CORE_BRIDGE_PYTHONCALLBACKLAYER_HPP
