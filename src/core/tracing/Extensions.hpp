///
/// @file Extensions.hpp
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
#ifndef SRC_CORE_TRACING_EXTENSIONS_HPP
#define SRC_CORE_TRACING_EXTENSIONS_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>

#include "src/core/common/TbExceptions.hpp"

namespace tb {
namespace tracing {

///
/// @brief Type keyed storage attached to a span, holding at most one value per type
///
/// Values are owned by the storage from insert until remove. Not synchronized, see SpanRef for the locked accessors.
///
class Extensions final {
  /// @brief type erased owner of one value
  class Slot {
  public:
    Slot() = default;
    Slot(Slot const &) = delete;
    Slot(Slot &&) = delete;
    Slot &operator=(Slot const &) = delete;
    Slot &operator=(Slot &&) = delete;
    virtual ~Slot() = default;
  };
  template <class T> class TypedSlot final : public Slot {
  public:
    explicit TypedSlot(T &&value) : value_(std::move(value)) {
    }
    T value_; ///< stored value
  };

public:
  /// @brief store @p value
  /// @throws RuntimeError Extension_already_present if a value of type T is stored already, @p value is left untouched then
  template <class T> void insert(T &&value) {
    std::type_index const key{typeid(T)};
    if (slots_.find(key) != slots_.end()) {
      throw RuntimeError(ErrorCode::Extension_already_present);
    }
    slots_.emplace(key, std::make_unique<TypedSlot<T>>(std::move(value)));
  }

  /// @brief stored value of type T, nullptr if there is none
  template <class T> T const *get() const {
    auto const it = slots_.find(std::type_index(typeid(T)));
    if (it == slots_.end()) {
      return nullptr;
    }
    return &static_cast<TypedSlot<T> const &>(*it->second).value_;
  }

  /// @brief stored value of type T, nullptr if there is none
  template <class T> T *getMut() {
    auto const it = slots_.find(std::type_index(typeid(T)));
    if (it == slots_.end()) {
      return nullptr;
    }
    return &static_cast<TypedSlot<T> &>(*it->second).value_;
  }

  /// @brief take the stored value of type T out of the storage
  template <class T> std::optional<T> remove() {
    auto const it = slots_.find(std::type_index(typeid(T)));
    if (it == slots_.end()) {
      return std::nullopt;
    }
    std::optional<T> value{std::move(static_cast<TypedSlot<T> &>(*it->second).value_)};
    slots_.erase(it);
    return value;
  }

  /// @brief number of stored values
  size_t size() const noexcept {
    return slots_.size();
  }

private:
  std::unordered_map<std::type_index, std::unique_ptr<Slot>> slots_; ///< one slot per stored type
};

} // namespace tracing
} // namespace tb

#endif // SRC_CORE_TRACING_EXTENSIONS_HPP
