///
/// @file SpanRef.hpp
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
#ifndef SRC_CORE_TRACING_SPANREF_HPP
#define SRC_CORE_TRACING_SPANREF_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <utility>

#include "Extensions.hpp"
#include "Metadata.hpp"
#include "SpanId.hpp"

namespace tb {
namespace tracing {

class Registry;

///
/// @brief Registry owned data of one live span
///
class SpanData final {
public:
  /// @brief constructor
  SpanData(SpanId const id, std::shared_ptr<Metadata const> metadata, std::optional<SpanId> const parent)
      : id_(id), metadata_(std::move(metadata)), parent_(parent), refCount_(1U) {
  }

private:
  friend class Registry;
  friend class SpanRef;

  SpanId id_;                               ///< id of the span
  std::shared_ptr<Metadata const> metadata_; ///< callsite description
  std::optional<SpanId> parent_;            ///< parent span, holding one reference on it
  std::atomic<uint32_t> refCount_;          ///< number of open handles
  mutable std::shared_mutex extensionsMutex_; ///< guards @b extensions_
  Extensions extensions_;                   ///< data attached by layers
};

///
/// @brief Reference to a live span, as handed to layers by Context
///
/// Keeps the span data alive but does not keep the span open. Each extension accessor locks the span's extensions for the duration
/// of that single operation only.
///
class SpanRef final {
public:
  /// @brief constructor
  explicit SpanRef(std::shared_ptr<SpanData> data) : data_(std::move(data)) {
  }

  SpanId getId() const noexcept {
    return data_->id_;
  }
  Metadata const &getMetadata() const noexcept {
    return *data_->metadata_;
  }
  std::shared_ptr<Metadata const> const &getMetadataPtr() const noexcept {
    return data_->metadata_;
  }
  std::optional<SpanId> const &getParent() const noexcept {
    return data_->parent_;
  }

  /// @brief copy of the attached value of type T
  template <class T> std::optional<T> getExtension() const {
    std::shared_lock<std::shared_mutex> const lock{data_->extensionsMutex_};
    T const *const value = data_->extensions_.get<T>();
    if (value == nullptr) {
      return std::nullopt;
    }
    return *value;
  }
  /// @brief attach @p value
  /// @throws RuntimeError Extension_already_present if a value of type T is attached already
  /// @note a rejected @p value is destroyed after the extension lock is released
  template <class T> void insertExtension(T value) const {
    std::unique_lock<std::shared_mutex> const lock{data_->extensionsMutex_};
    data_->extensions_.insert<T>(std::move(value));
  }
  /// @brief detach the value of type T and hand it to the caller
  template <class T> std::optional<T> removeExtension() const {
    std::unique_lock<std::shared_mutex> const lock{data_->extensionsMutex_};
    return data_->extensions_.remove<T>();
  }
  /// @brief whether a value of type T is attached
  template <class T> bool hasExtension() const {
    std::shared_lock<std::shared_mutex> const lock{data_->extensionsMutex_};
    return data_->extensions_.get<T>() != nullptr;
  }

private:
  std::shared_ptr<SpanData> data_; ///< referenced span
};

} // namespace tracing
} // namespace tb

#endif // SRC_CORE_TRACING_SPANREF_HPP
