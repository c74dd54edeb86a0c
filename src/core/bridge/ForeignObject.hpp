///
/// @file ForeignObject.hpp
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
#ifndef SRC_CORE_BRIDGE_FOREIGNOBJECT_HPP
#define SRC_CORE_BRIDGE_FOREIGNOBJECT_HPP

#include <memory>
#include <pybind11/pybind11.h>

namespace tb {
namespace bridge {

///
/// @brief Owning reference to a python object which may be released from any thread
///
/// The destructor takes the GIL to drop the reference. If the interpreter is already finalized the reference is abandoned
/// instead.
///
class ForeignObject final {
public:
  /// @brief constructor
  /// @note requires the GIL
  explicit ForeignObject(pybind11::object object) noexcept : object_(std::move(object)) {
  }
  ~ForeignObject() noexcept;
  ForeignObject(ForeignObject const &) = delete;
  ForeignObject(ForeignObject &&) = delete;
  ForeignObject &operator=(ForeignObject const &) = delete;
  ForeignObject &operator=(ForeignObject &&) = delete;

  /// @brief the referenced object
  /// @note requires the GIL to use the result
  pybind11::object const &get() const noexcept {
    return object_;
  }

private:
  pybind11::object object_; ///< owned reference
};

///
/// @brief Foreign state attached to one span
///
/// Copies share the same python object, so reading the state out of the span needs no GIL.
///
class SpanState final {
public:
  /// @brief constructor
  explicit SpanState(std::shared_ptr<ForeignObject const> object) noexcept : object_(std::move(object)) {
  }

  /// @brief new reference to the state object
  /// @note requires the GIL
  pybind11::object toPython() const {
    return object_->get();
  }

private:
  std::shared_ptr<ForeignObject const> object_; ///< state object
};

} // namespace bridge
} // namespace tb

#endif // SRC_CORE_BRIDGE_FOREIGNOBJECT_HPP
