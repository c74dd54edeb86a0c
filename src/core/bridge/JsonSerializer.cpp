///
/// @file JsonSerializer.cpp
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
#include <nlohmann/json.hpp>
#include <string>

#include "JsonSerializer.hpp"

#include "src/core/common/TbExceptions.hpp"
#include "src/core/common/util.hpp"
#include "src/core/tracing/Level.hpp"

namespace tb {
namespace bridge {
namespace json {

namespace {
void appendValues(nlohmann::ordered_json &object, tracing::ValueSet const &values) {
  for (tracing::FieldEntry const &entry : values) {
    object[entry.name] = fromValue(entry.value);
  }
}

std::string dump(nlohmann::ordered_json const &object) {
  try {
    return object.dump();
  } catch (nlohmann::json::type_error const &) {
    // invalid UTF-8 in a string value
    throw RuntimeError(ErrorCode::Serialization_failed);
  }
}

nlohmann::ordered_json fromSpanId(tracing::SpanId const &id) {
  return nlohmann::ordered_json::array({id.getValue()});
}
} // namespace

nlohmann::ordered_json fromMetadata(tracing::Metadata const &metadata) {
  nlohmann::ordered_json object = nlohmann::ordered_json::object();
  object["name"] = metadata.getName();
  object["target"] = metadata.getTarget();
  object["level"] = tracing::toString(metadata.getLevel());
  object["module_path"] = metadata.getModulePath();
  object["file"] = metadata.getFile();
  object["line"] = metadata.getLine();
  object["fields"] = metadata.getFields();
  object["is_span"] = metadata.isSpan();
  object["is_event"] = metadata.isEvent();
  return object;
}

nlohmann::ordered_json fromValue(tracing::FieldValue const &value) {
  switch (value.getKind()) {
  case tracing::FieldValue::Kind::Bool:
    return value.getBool();
  case tracing::FieldValue::Kind::Signed:
    return value.getSigned();
  case tracing::FieldValue::Kind::Unsigned:
    return value.getUnsigned();
  case tracing::FieldValue::Kind::Double:
    return value.getDouble();
  case tracing::FieldValue::Kind::String:
    return value.getString();
  case tracing::FieldValue::Kind::Debug:
    return value.getDebug().getRepr();
  default:
    UNREACHABLE(return nullptr, "unknown field value kind")
  }
}

std::string serializeEvent(tracing::Event const &event) {
  nlohmann::ordered_json object = nlohmann::ordered_json::object();
  object["metadata"] = fromMetadata(event.getMetadata());
  appendValues(object, event.getValues());
  return dump(object);
}

std::string serializeAttributes(tracing::Attributes const &attributes) {
  nlohmann::ordered_json object = nlohmann::ordered_json::object();
  object["metadata"] = fromMetadata(attributes.getMetadata());
  if (attributes.getParent().has_value()) {
    object["parent"] = fromSpanId(*attributes.getParent());
  } else {
    object["parent"] = nullptr;
  }
  object["is_root"] = attributes.isRoot();
  appendValues(object, attributes.getValues());
  return dump(object);
}

std::string serializeSpanId(tracing::SpanId const &id) {
  return dump(fromSpanId(id));
}

std::string serializeRecord(tracing::Record const &record) {
  nlohmann::ordered_json object = nlohmann::ordered_json::object();
  appendValues(object, record.getValues());
  return dump(object);
}

} // namespace json
} // namespace bridge
} // namespace tb
