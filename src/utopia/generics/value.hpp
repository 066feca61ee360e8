/* Utopia
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#pragma once

#include "utopia/generics/data_type.hpp"
#include "utopia/generics/extra_boolean.hpp"
#include <boost/any.hpp>
#include <boost/date_time/gregorian/gregorian_types.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <string>

namespace utopia::generics
{

/**
 * An immutable (payload, Data_type) pair, the unit of data the generics module converts and computes with.  The
 * payload is a `boost::any`; for the basic types its C++ shape is fixed (see the `of_*()` factories, which are the
 * recommended way to make values of those types).  An empty payload makes the Value *null*; a null Value still
 * carries its type.
 *
 * Value has pure value semantics: copyable, assignable, comparable (see `==`), and it performs no I/O.  Anything
 * involving conversion needs a Data_type_registry, passed explicitly: see cast_to() and the `to_*()` family.
 *
 * ### Payload shapes of the basic types ###
 *   - STRING: `std::string`.
 *   - INTEGER: `int32_t`.
 *   - LONG: `int64_t`.
 *   - DOUBLE, NUMBER: `double`.
 *   - BOOLEAN: `bool`.
 *   - EXTRA_BOOLEAN: Extra_boolean.
 *   - DATE: `boost::gregorian::date`.
 *   - DATETIME: `boost::posix_time::ptime`.
 */
class Value
{
public:
  // Constructors/destructor.

  /// Constructs a null, untyped Value.
  Value();

  /**
   * Constructs a Value with an arbitrary payload and type.  For basic types prefer the `of_*()` factories, which
   * guarantee the payload shape.
   *
   * @param payload
   *        Payload; empty means null.
   * @param type
   *        Type.
   */
  explicit Value(boost::any payload, const Data_type& type);

  /**
   * INTEGER value.
   *
   * @param val
   *        Payload.
   * @return See above.
   */
  static Value of_integer(int32_t val);
  /**
   * LONG value.
   *
   * @param val
   *        Payload.
   * @return See above.
   */
  static Value of_long(int64_t val);
  /**
   * DOUBLE value.
   *
   * @param val
   *        Payload.
   * @return See above.
   */
  static Value of_double(double val);
  /**
   * NUMBER value.
   *
   * @param val
   *        Payload.
   * @return See above.
   */
  static Value of_number(double val);
  /**
   * STRING value.
   *
   * @param val
   *        Payload.
   * @return See above.
   */
  static Value of_string(util::String_view val);
  /**
   * BOOLEAN value.
   *
   * @param val
   *        Payload.
   * @return See above.
   */
  static Value of_boolean(bool val);
  /**
   * EXTRA_BOOLEAN value.
   *
   * @param val
   *        Payload.
   * @return See above.
   */
  static Value of_extra_boolean(Extra_boolean val);
  /**
   * DATE value.
   *
   * @param val
   *        Payload.
   * @return See above.
   */
  static Value of_date(const boost::gregorian::date& val);
  /**
   * DATETIME value.
   *
   * @param val
   *        Payload.
   * @return See above.
   */
  static Value of_date_time(const boost::posix_time::ptime& val);

  /**
   * Null value of the given type.
   *
   * @param type
   *        Type.
   * @return See above.
   */
  static Value null(const Data_type& type);

  // Methods.

  /**
   * The type.
   *
   * @return See above.
   */
  const Data_type& type() const;

  /**
   * The payload; empty if and only if is_null().
   *
   * @return See above.
   */
  const boost::any& raw() const;

  /**
   * `true` if and only if the payload is empty.
   *
   * @return See above.
   */
  bool is_null() const;

  /**
   * Converts to the given type via `registry.convert()`, with the same semantics and errors.
   *
   * @param registry
   *        Registry.
   * @param target
   *        Target type.
   * @param err_code
   *        See utopia::Error_code docs for error reporting semantics.  See Data_type_registry::convert().
   * @return The converted Value.
   */
  Value cast_to(const Data_type_registry& registry, const Data_type& target, Error_code* err_code = 0) const;

  /**
   * Converts to STRING and unwraps the payload.
   *
   * @param registry
   *        Registry.
   * @param err_code
   *        See utopia::Error_code docs for error reporting semantics.  In addition to cast_to() errors:
   *        generics::error::Code::S_NULL_VALUE (the converted value is null);
   *        generics::error::Code::S_VALUE_PARSE_FAILED (the converted payload is not of the expected shape).
   * @return See above.
   */
  std::string to_string(const Data_type_registry& registry, Error_code* err_code = 0) const;

  /**
   * Converts to INTEGER and unwraps the payload.  See to_string().
   *
   * @param registry
   *        Registry.
   * @param err_code
   *        See to_string().
   * @return See above.
   */
  int32_t to_integer(const Data_type_registry& registry, Error_code* err_code = 0) const;

  /**
   * Converts to LONG and unwraps the payload.  See to_string().
   *
   * @param registry
   *        Registry.
   * @param err_code
   *        See to_string().
   * @return See above.
   */
  int64_t to_long(const Data_type_registry& registry, Error_code* err_code = 0) const;

  /**
   * Converts to DOUBLE and unwraps the payload.  See to_string().
   *
   * @param registry
   *        Registry.
   * @param err_code
   *        See to_string().
   * @return See above.
   */
  double to_double(const Data_type_registry& registry, Error_code* err_code = 0) const;

  /**
   * Converts to BOOLEAN and unwraps the payload.  See to_string().
   *
   * @param registry
   *        Registry.
   * @param err_code
   *        See to_string().
   * @return See above.
   */
  bool to_boolean(const Data_type_registry& registry, Error_code* err_code = 0) const;

  /**
   * Converts to EXTRA_BOOLEAN and unwraps the payload.  See to_string().
   *
   * @param registry
   *        Registry.
   * @param err_code
   *        See to_string().
   * @return See above.
   */
  Extra_boolean to_extra_boolean(const Data_type_registry& registry, Error_code* err_code = 0) const;

  /**
   * Converts to DATE and unwraps the payload.  See to_string().
   *
   * @param registry
   *        Registry.
   * @param err_code
   *        See to_string().
   * @return See above.
   */
  boost::gregorian::date to_date(const Data_type_registry& registry, Error_code* err_code = 0) const;

  /**
   * Converts to DATETIME and unwraps the payload.  See to_string().
   *
   * @param registry
   *        Registry.
   * @param err_code
   *        See to_string().
   * @return See above.
   */
  boost::posix_time::ptime to_date_time(const Data_type_registry& registry, Error_code* err_code = 0) const;

  /**
   * Human-readable rendering of the payload: as by render_basic_payload() for basic shapes; "null" if null;
   * "<custom>" otherwise.
   *
   * @return See above.
   */
  std::string rendering() const;

  /**
   * "<rendering> (<TYPE>)", e.g., "42 (INTEGER)"; for diagnostics.
   *
   * @return See above.
   */
  std::string description() const;

private:
  // Methods.

  /**
   * Helper for the `to_*()` family: cast_to() `target`, then extract the payload as a `T`.
   *
   * @tparam T
   *         Payload shape of `target`.
   * @param registry
   *        Registry.
   * @param target
   *        Target type.
   * @param err_code
   *        Not null.
   * @return See above.
   */
  template<typename T>
  T cast_and_unwrap(const Data_type_registry& registry, const Data_type& target, Error_code* err_code) const;

  // Data.

  /// See raw().
  boost::any m_payload;

  /// See type().
  Data_type m_type;
}; // class Value

// Free functions: in *_fwd.hpp, or here if not publicly forward-declared.

/**
 * Renders a payload of one of the basic shapes (see Value doc header): numbers in shortest round-trip form;
 * `bool` as "true"/"false"; Extra_boolean by name; dates and times in ISO extended form ("2024-01-31",
 * "2024-01-31T12:00:00"); strings as-is.
 *
 * @param payload
 *        Payload.
 * @param result
 *        Where to put the rendering on success.
 * @return `false` if the payload is empty or of another shape; `true` otherwise.
 */
bool render_basic_payload(const boost::any& payload, std::string* result);

/**
 * `true` if and only if both have the same type, and the payloads are either both empty or of the same basic shape
 * with equal contents.  Non-empty payloads of other shapes are never equal.
 *
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 * @return See above.
 */
bool operator==(const Value& val1, const Value& val2);

/**
 * Negation of `==`.
 *
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 * @return See above.
 */
bool operator!=(const Value& val1, const Value& val2);

} // namespace utopia::generics
