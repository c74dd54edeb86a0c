///
/// @file Span.cpp
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
#include <string>
#include <utility>

#include "Dispatch.hpp"
#include "Span.hpp"

namespace tb {
namespace tracing {

namespace {
std::vector<std::string> declareFields(ValueSet const &values, std::vector<std::string> const &emptyFields) {
  std::vector<std::string> fields{};
  fields.reserve(values.size() + emptyFields.size());
  for (FieldEntry const &entry : values) {
    fields.push_back(entry.name);
  }
  fields.insert(fields.end(), emptyFields.begin(), emptyFields.end());
  return fields;
}
} // namespace

Span::Entered::Entered(std::shared_ptr<Registry> registry, std::optional<SpanId> const id) : registry_(std::move(registry)), id_(id) {
  if (id_.has_value()) {
    registry_->enter(*id_);
  }
}

Span::Entered::~Entered() noexcept {
  if (id_.has_value()) {
    registry_->exit(*id_);
  }
}

Span::Span(std::shared_ptr<Registry> registry, SpanId const id, std::shared_ptr<Metadata const> metadata) noexcept
    : registry_(std::move(registry)), id_(id), metadata_(std::move(metadata)) {
}

Span::~Span() noexcept {
  release();
}

Span::Span(Span const &other) : registry_(other.registry_), id_(other.id_), metadata_(other.metadata_) {
  if (id_.has_value()) {
    registry_->cloneSpan(*id_);
  }
}

Span::Span(Span &&other) noexcept
    : registry_(std::move(other.registry_)), id_(std::exchange(other.id_, std::nullopt)), metadata_(std::move(other.metadata_)) {
}

Span &Span::operator=(Span const &other) {
  if (this != &other) {
    Span copy{other};
    *this = std::move(copy);
  }
  return *this;
}

Span &Span::operator=(Span &&other) noexcept {
  if (this != &other) {
    release();
    registry_ = std::move(other.registry_);
    id_ = std::exchange(other.id_, std::nullopt);
    metadata_ = std::move(other.metadata_);
  }
  return *this;
}

void Span::release() noexcept {
  if (id_.has_value()) {
    static_cast<void>(registry_->tryClose(*id_));
    id_.reset();
  }
}

Span Span::create(Metadata const &metadata, ValueSet const &values, Parent const parent) {
  std::shared_ptr<Registry> registry{dispatch::getCurrent()};
  if ((registry == nullptr) || !registry->isEnabled(metadata.getLevel())) {
    return Span{};
  }
  SpanId const id = registry->newSpan(Attributes{metadata, values, parent});
  std::shared_ptr<Metadata const> storedMetadata{registry->span(id)->getMetadataPtr()};
  return Span{std::move(registry), id, std::move(storedMetadata)};
}

Span Span::create(Callsite const &callsite, std::string name, ValueSet const &values, std::vector<std::string> const &emptyFields,
                  Parent const parent) {
  Metadata const metadata{std::move(name), callsite.target, callsite.level, callsite.file, callsite.line, declareFields(values, emptyFields),
                          Metadata::Kind::Span};
  return create(metadata, values, parent);
}

Span Span::current() {
  std::shared_ptr<Registry> registry{dispatch::getCurrent()};
  if (registry == nullptr) {
    return Span{};
  }
  std::optional<SpanRef> const current = registry->lookupCurrent();
  if (!current.has_value()) {
    return Span{};
  }
  registry->cloneSpan(current->getId());
  return Span{std::move(registry), current->getId(), current->getMetadataPtr()};
}

Span::Entered Span::enter() const {
  return Entered{registry_, id_};
}

Span const &Span::record(std::string const &field, FieldValue value) const {
  if (!id_.has_value() || !metadata_->hasField(field)) {
    return *this;
  }
  ValueSet const values{FieldEntry{field, std::move(value)}};
  registry_->record(*id_, Record{values});
  return *this;
}

void emitEvent(Metadata const &metadata, ValueSet const &values, Parent const parent) {
  std::shared_ptr<Registry> const registry{dispatch::getCurrent()};
  if ((registry == nullptr) || !registry->isEnabled(metadata.getLevel())) {
    return;
  }
  registry->event(Event{metadata, values, parent});
}

void emitEvent(Callsite const &callsite, std::string message, ValueSet const &fields, Parent const parent) {
  std::shared_ptr<Registry> const registry{dispatch::getCurrent()};
  if ((registry == nullptr) || !registry->isEnabled(callsite.level)) {
    return;
  }
  ValueSet values{};
  values.reserve(fields.size() + 1U);
  values.push_back(FieldEntry{"message", std::move(message)});
  values.insert(values.end(), fields.begin(), fields.end());

  std::string name{"event "};
  name.append(callsite.file).append(":").append(std::to_string(callsite.line));
  Metadata const metadata{std::move(name), callsite.target, callsite.level, callsite.file, callsite.line, declareFields(values, {}),
                          Metadata::Kind::Event};
  registry->event(Event{metadata, values, parent});
}

Parent parentOf(Span const &span) noexcept {
  if (span.isNone()) {
    return Parent::root();
  }
  return Parent::explicitly(*span.getId());
}

} // namespace tracing
} // namespace tb
