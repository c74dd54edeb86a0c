///
/// @file JsonSerializer.hpp
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
#ifndef SRC_CORE_BRIDGE_JSONSERIALIZER_HPP
#define SRC_CORE_BRIDGE_JSONSERIALIZER_HPP

#include <nlohmann/json.hpp>
#include <string>

#include "src/core/tracing/Attributes.hpp"
#include "src/core/tracing/FieldValue.hpp"
#include "src/core/tracing/Metadata.hpp"
#include "src/core/tracing/SpanId.hpp"

namespace tb {
namespace bridge {

///
/// @brief JSON encoding of tracing data handed to foreign layers
///
/// All functions are pure. Keys keep their insertion order. Encoding errors throw RuntimeError Serialization_failed.
///
namespace json {

/// @brief {"name", "target", "level", "module_path", "file", "line", "fields": [...], "is_span", "is_event"}
nlohmann::ordered_json fromMetadata(tracing::Metadata const &metadata);
/// @brief number, bool or string, debug values use their representation
nlohmann::ordered_json fromValue(tracing::FieldValue const &value);

/// @brief {"metadata": {...}, <field>: <value>, ...} including the "message" field
std::string serializeEvent(tracing::Event const &event);
/// @brief {"metadata": {...}, "parent": [id] or null, "is_root": bool, <field>: <value>, ...} with the values present at creation
std::string serializeAttributes(tracing::Attributes const &attributes);
/// @brief [id]
std::string serializeSpanId(tracing::SpanId const &id);
/// @brief {<field>: <value>, ...} with the recorded values only
std::string serializeRecord(tracing::Record const &record);

} // namespace json
} // namespace bridge
} // namespace tb

#endif // SRC_CORE_BRIDGE_JSONSERIALIZER_HPP
