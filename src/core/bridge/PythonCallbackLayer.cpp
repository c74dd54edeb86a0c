///
/// @file PythonCallbackLayer.cpp
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
#include <cstddef>
#include <memory>
#include <optional>
#include <pybind11/pybind11.h>
#include <string>
#include <utility>

#include "JsonSerializer.hpp"
#include "PythonCallbackLayer.hpp"

#include "src/core/common/TbExceptions.hpp"
#include "src/core/tracing/SpanRef.hpp"

namespace tb {
namespace bridge {

using Hook = ForeignCallbacks::Hook;

namespace {
ForeignCallbacks resolveCallbacks(pybind11::handle impl) {
  if (Py_IsInitialized() == 0) {
    throw RuntimeError(ErrorCode::Python_interpreter_not_initialized);
  }
  pybind11::gil_scoped_acquire const gil{};
  return ForeignCallbacks{impl};
}

/// @note requires the GIL
pybind11::object toPython(std::optional<SpanState> const &state) {
  if (!state.has_value()) {
    return pybind11::none();
  }
  return state->toPython();
}
} // namespace

PythonCallbackLayer::PythonCallbackLayer(pybind11::handle impl, ILogger *const logger) : callbacks_(resolveCallbacks(impl)), logger_(logger) {
  if (logger_ != nullptr) {
    for (size_t i = 0U; i < ForeignCallbacks::HookCount; i++) {
      Hook const hook = static_cast<Hook>(i);
      *logger_ << "python layer method " << ForeignCallbacks::getName(hook) << (callbacks_.has(hook) ? " resolved" : " not found, hook disabled")
               << endStatement<LogLevel::LOGDEBUG>;
    }
  }
}

template <class... Args> std::optional<pybind11::object> PythonCallbackLayer::invokeIsolated(Hook const hook, Args &&...args) const {
  try {
    return callbacks_.get(hook)->get()(std::forward<Args>(args)...);
  } catch (pybind11::error_already_set const &error) {
    // the python error indicator was fetched into error and is dropped with it
    if (logger_ != nullptr) {
      *logger_ << "python " << ForeignCallbacks::getName(hook) << " raised: " << std::string{error.what()} << endStatement<LogLevel::LOGWARNING>;
    }
    return std::nullopt;
  }
}

void PythonCallbackLayer::onEvent(tracing::Event const &event, tracing::Context const &ctx) {
  if (!callbacks_.has(Hook::OnEvent)) {
    return;
  }

  std::optional<tracing::SpanRef> currentSpan{};
  if (event.getParent().has_value()) {
    currentSpan = ctx.span(*event.getParent());
  }
  if (!currentSpan.has_value()) {
    currentSpan = ctx.lookupCurrent();
  }
  std::optional<SpanState> state{};
  if (currentSpan.has_value()) {
    state = currentSpan->getExtension<SpanState>();
  }
  std::string const jsonEvent = json::serializeEvent(event);

  pybind11::gil_scoped_acquire const gil{};
  static_cast<void>(invokeIsolated(Hook::OnEvent, jsonEvent, toPython(state)));
}

void PythonCallbackLayer::onNewSpan(tracing::Attributes const &attributes, tracing::SpanId const &id, tracing::Context const &ctx) {
  if (!callbacks_.has(Hook::OnNewSpan)) {
    return;
  }
  std::optional<tracing::SpanRef> const span = ctx.span(id);
  if (!span.has_value()) {
    return;
  }

  std::string const jsonAttributes = json::serializeAttributes(attributes);
  std::string const jsonId = json::serializeSpanId(id);

  std::shared_ptr<ForeignObject const> state{};
  {
    pybind11::gil_scoped_acquire const gil{};
    std::optional<pybind11::object> result = invokeIsolated(Hook::OnNewSpan, jsonAttributes, jsonId);
    if (result.has_value() && !result->is_none()) {
      state = std::make_shared<ForeignObject const>(std::move(*result));
    }
  }
  if (state != nullptr) {
    span->insertExtension(SpanState{std::move(state)});
  }
}

void PythonCallbackLayer::onClose(tracing::SpanId const &id, tracing::Context const &ctx) {
  if (!callbacks_.has(Hook::OnClose)) {
    return;
  }
  std::optional<tracing::SpanRef> const span = ctx.span(id);
  if (!span.has_value()) {
    return;
  }

  std::string const jsonId = json::serializeSpanId(id);
  std::optional<SpanState> state = span->removeExtension<SpanState>();

  pybind11::gil_scoped_acquire const gil{};
  static_cast<void>(invokeIsolated(Hook::OnClose, jsonId, toPython(state)));
  state.reset();
}

void PythonCallbackLayer::onRecord(tracing::SpanId const &id, tracing::Record const &values, tracing::Context const &ctx) {
  if (!callbacks_.has(Hook::OnRecord)) {
    return;
  }
  std::optional<tracing::SpanRef> const span = ctx.span(id);
  if (!span.has_value()) {
    return;
  }

  std::string const jsonId = json::serializeSpanId(id);
  std::string const jsonValues = json::serializeRecord(values);
  std::optional<SpanState> const state = span->getExtension<SpanState>();

  pybind11::gil_scoped_acquire const gil{};
  static_cast<void>(invokeIsolated(Hook::OnRecord, jsonId, jsonValues, toPython(state)));
}

} // namespace bridge
} // namespace tb
