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

#include "utopia/generics/generics_fwd.hpp"
#include <string>

namespace utopia::generics
{

/**
 * A named data type tag.  Two Data_type objects are equal if and only if their names are equal; so a Data_type is
 * freely copyable and can be (re)created from its name anywhere.  By itself a Data_type knows nothing about its
 * place in a hierarchy or about conversions; Data_type_registry holds that knowledge.
 *
 * A default-constructed Data_type has an empty name and is called *untyped*; it is what a default-constructed Value
 * carries.
 */
class Data_type
{
public:
  // Constructors/destructor.

  /// Constructs the untyped Data_type.
  Data_type();

  /**
   * Constructs a Data_type with the given name.
   *
   * @param name
   *        The name; by convention upper-case, e.g., "INTEGER".
   */
  explicit Data_type(util::String_view name);

  // Methods.

  /**
   * The name.
   *
   * @return See above.
   */
  const std::string& name() const;

  /**
   * Returns `true` if and only if this is the untyped Data_type.
   *
   * @return See above.
   */
  bool untyped() const;

private:
  // Data.

  /// See name().
  std::string m_name;
}; // class Data_type

// Free functions: in *_fwd.hpp, or here if not publicly forward-declared.

/**
 * Returns `true` if and only if the names are equal.
 *
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 * @return See above.
 */
bool operator==(const Data_type& val1, const Data_type& val2);

/**
 * Negation of `==`.
 *
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 * @return See above.
 */
bool operator!=(const Data_type& val1, const Data_type& val2);

/**
 * Orders by name; so Data_type can be an ordered-container key.
 *
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 * @return See above.
 */
bool operator<(const Data_type& val1, const Data_type& val2);

/**
 * Hash of the name; so Data_type can be a boost.unordered key.
 *
 * @param val
 *        Object.
 * @return See above.
 */
size_t hash_value(const Data_type& val);

/**
 * The data types provided by the library.  Each function returns a reference to a `static` object.
 * Data_type_registry::create_with_basic_types() registers them all with this hierarchy: INTEGER, LONG, and
 * DOUBLE are children of NUMBER; the rest are roots.
 */
namespace basic_types
{

/// STRING: payload `std::string`.
const Data_type& string();
/// NUMBER: payload `double`.  Parent of INTEGER, LONG, and DOUBLE.
const Data_type& number();
/// LONG: payload `int64_t`.
const Data_type& long_();
/// INTEGER: payload `int32_t`.
const Data_type& integer();
/// DOUBLE: payload `double`.
const Data_type& double_();
/// BOOLEAN: payload `bool`.
const Data_type& boolean();
/// EXTRA_BOOLEAN: payload generics::Extra_boolean.
const Data_type& extra_boolean();
/// DATE: payload `boost::gregorian::date`.
const Data_type& date();
/// DATETIME: payload `boost::posix_time::ptime`.
const Data_type& date_time();
/// VARIABLE: named only; no payload shape or conversions.
const Data_type& variable();
/// MODEL: named only; no payload shape or conversions.
const Data_type& model();

/**
 * Returns `true` if `type` is one of INTEGER, LONG, DOUBLE, NUMBER.
 *
 * @param type
 *        Type to check.
 * @return See above.
 */
bool is_number(const Data_type& type);

} // namespace basic_types

} // namespace utopia::generics
