///
/// @file FieldValue.hpp
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
#ifndef SRC_CORE_TRACING_FIELDVALUE_HPP
#define SRC_CORE_TRACING_FIELDVALUE_HPP

#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "src/config.hpp"

namespace tb {
namespace tracing {

///
/// @brief Value recorded through its debug representation
///
class DebugValue final {
public:
  /// @brief constructor
  /// @param repr already rendered debug representation
  explicit DebugValue(std::string repr) : repr_(std::move(repr)) {
  }
  /// @brief see @b repr_
  std::string const &getRepr() const TB_NOEXCEPT {
    return repr_;
  }

private:
  std::string repr_; ///< rendered representation
};

///
/// @brief Debug representation of a string: quoted with quotes, backslashes and control characters escaped
///
DebugValue debug(std::string_view const value);
/// @brief see debug(std::string_view)
DebugValue debug(std::string const &value);
/// @brief see debug(std::string_view)
DebugValue debug(char const *const value);
/// @brief Debug representation of any streamable value
template <class T> DebugValue debug(T const &value) {
  std::ostringstream stream{};
  stream << value;
  return DebugValue{stream.str()};
}

///
/// @brief A single field value of a span or event
///
class FieldValue final {
public:
  /// @brief kind of the stored value
  enum class Kind : uint8_t { Bool, Signed, Unsigned, Double, String, Debug };

  FieldValue(bool const value) : value_(value) { // NOLINT(google-explicit-constructor)
  }
  template <class T, std::enable_if_t<std::is_integral<T>::value && std::is_signed<T>::value, bool> = true>
  FieldValue(T const value) : value_(static_cast<int64_t>(value)) { // NOLINT(google-explicit-constructor)
  }
  template <class T, std::enable_if_t<std::is_integral<T>::value && std::is_unsigned<T>::value && !std::is_same<T, bool>::value, bool> = true>
  FieldValue(T const value) : value_(static_cast<uint64_t>(value)) { // NOLINT(google-explicit-constructor)
  }
  template <class T, std::enable_if_t<std::is_floating_point<T>::value, bool> = true>
  FieldValue(T const value) : value_(static_cast<double>(value)) { // NOLINT(google-explicit-constructor)
  }
  FieldValue(char const *const value) : value_(std::string{value}) { // NOLINT(google-explicit-constructor)
  }
  FieldValue(std::string value) : value_(std::move(value)) { // NOLINT(google-explicit-constructor)
  }
  FieldValue(DebugValue value) : value_(std::move(value)) { // NOLINT(google-explicit-constructor)
  }

  /// @brief kind of the stored value
  Kind getKind() const TB_NOEXCEPT {
    return static_cast<Kind>(value_.index());
  }
  /// @brief stored bool, only valid for Kind::Bool
  bool getBool() const {
    return std::get<bool>(value_);
  }
  /// @brief stored signed integer, only valid for Kind::Signed
  int64_t getSigned() const {
    return std::get<int64_t>(value_);
  }
  /// @brief stored unsigned integer, only valid for Kind::Unsigned
  uint64_t getUnsigned() const {
    return std::get<uint64_t>(value_);
  }
  /// @brief stored floating point number, only valid for Kind::Double
  double getDouble() const {
    return std::get<double>(value_);
  }
  /// @brief stored string, only valid for Kind::String
  std::string const &getString() const {
    return std::get<std::string>(value_);
  }
  /// @brief stored debug representation, only valid for Kind::Debug
  DebugValue const &getDebug() const {
    return std::get<DebugValue>(value_);
  }

private:
  // order must match Kind
  std::variant<bool, int64_t, uint64_t, double, std::string, DebugValue> value_;
};

///
/// @brief Named field value
///
struct FieldEntry final {
  std::string name; ///< declared field name
  FieldValue value; ///< recorded value
};

/// @brief Values recorded in one call, in recording order
using ValueSet = std::vector<FieldEntry>;

} // namespace tracing
} // namespace tb

#endif // SRC_CORE_TRACING_FIELDVALUE_HPP
