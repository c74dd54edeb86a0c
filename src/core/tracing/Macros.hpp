///
/// @file Macros.hpp
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
#ifndef SRC_CORE_TRACING_MACROS_HPP
#define SRC_CORE_TRACING_MACROS_HPP

#include "Span.hpp"

#include "src/config.hpp"

///
/// @brief Callsite at the current source location
///
#define TB_CALLSITE(LEVEL) (::tb::tracing::Callsite{TB_TRACING_TARGET, LEVEL, __FILE__, static_cast<uint32_t>(__LINE__)})

///
/// @brief Create a span in the current registry
///
/// Usage: TB_SPAN(level, "name", {{"field", value}, ...}, {"declaredButEmpty", ...})
/// Both brace lists are optional.
///
#define TB_SPAN(LEVEL, NAME, ...) (::tb::tracing::Span::create(TB_CALLSITE(LEVEL), NAME __VA_OPT__(, ) __VA_ARGS__))

#define TB_TRACE_SPAN(NAME, ...) TB_SPAN(::tb::tracing::Level::Trace, NAME __VA_OPT__(, ) __VA_ARGS__)
#define TB_DEBUG_SPAN(NAME, ...) TB_SPAN(::tb::tracing::Level::Debug, NAME __VA_OPT__(, ) __VA_ARGS__)
#define TB_INFO_SPAN(NAME, ...) TB_SPAN(::tb::tracing::Level::Info, NAME __VA_OPT__(, ) __VA_ARGS__)
#define TB_WARN_SPAN(NAME, ...) TB_SPAN(::tb::tracing::Level::Warn, NAME __VA_OPT__(, ) __VA_ARGS__)
#define TB_ERROR_SPAN(NAME, ...) TB_SPAN(::tb::tracing::Level::Error, NAME __VA_OPT__(, ) __VA_ARGS__)

///
/// @brief Emit an event with the span entered on the current thread as parent
///
/// Usage: TB_EVENT(level, message, {{"field", value}, ...})
/// The field list is optional.
///
#define TB_EVENT(LEVEL, MESSAGE, ...) (::tb::tracing::emitEvent(TB_CALLSITE(LEVEL), MESSAGE __VA_OPT__(, ) __VA_ARGS__))

///
/// @brief Emit an event with an explicit parent span
///
/// Usage: TB_EVENT_IN(parentSpan, level, message, {{"field", value}, ...})
///
#define TB_EVENT_IN(PARENT, LEVEL, MESSAGE, ...)                                                                                               \
  (::tb::tracing::emitEvent(::tb::tracing::parentOf(PARENT), TB_CALLSITE(LEVEL), MESSAGE __VA_OPT__(, ) __VA_ARGS__))

#define TB_TRACE(MESSAGE, ...) TB_EVENT(::tb::tracing::Level::Trace, MESSAGE __VA_OPT__(, ) __VA_ARGS__)
#define TB_DEBUG(MESSAGE, ...) TB_EVENT(::tb::tracing::Level::Debug, MESSAGE __VA_OPT__(, ) __VA_ARGS__)
#define TB_INFO(MESSAGE, ...) TB_EVENT(::tb::tracing::Level::Info, MESSAGE __VA_OPT__(, ) __VA_ARGS__)
#define TB_WARN(MESSAGE, ...) TB_EVENT(::tb::tracing::Level::Warn, MESSAGE __VA_OPT__(, ) __VA_ARGS__)
#define TB_ERROR(MESSAGE, ...) TB_EVENT(::tb::tracing::Level::Error, MESSAGE __VA_OPT__(, ) __VA_ARGS__)

#endif // SRC_CORE_TRACING_MACROS_HPP
