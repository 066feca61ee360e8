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

#include "utopia/util/util_fwd.hpp"
#include "utopia/common.hpp"
#include <boost/shared_ptr.hpp>
#include <iosfwd>

/**
 * Utopia module providing a dynamic, registry-driven value system.
 *
 * The pieces, leaves first:
 *   - generics::Data_type: a named type tag ("INTEGER").  The basic ones are in generics::basic_types.
 *   - generics::Extra_boolean: a four-valued truthiness (EXTRA_FALSE, WEAK_FALSE, WEAK_TRUE, EXTRA_TRUE).
 *   - generics::Value: an immutable (payload, Data_type) pair; the payload is a `boost::any`.
 *   - generics::Value_parser: converts Value%s between Data_type%s and declares which conversions it supports,
 *     each with a generics::Conversion_reliability.  generics::Basic_value_parser covers the basic types.
 *   - generics::Data_type_registry: owns the type forest ("INTEGER is a NUMBER") and an ordered chain of
 *     Value_parser%s; converts values; and ranks hypothetical conversions by reliability along the cheapest route.
 *   - Value operators (generics::plus() and friends).
 *
 * There is no global registry: construct one (usually via Data_type_registry::create_with_basic_types()) and pass
 * it by reference to whatever needs it.
 */
namespace utopia::generics
{

// Types.

// Find doc headers near the bodies of these compound types.

class Basic_value_parser;
struct Conversion;
class Data_type;
class Data_type_registry;
class Value;
class Value_parser;

enum class Conversion_reliability;
enum class Extra_boolean;

/// Short-hand for ref-counted pointer to a Value_parser; the registry and its users share ownership.
using Value_parser_ptr = boost::shared_ptr<Value_parser>;

// Free functions.

/**
 * Prints the name of the data type.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Data_type& val);

/**
 * Prints the description of the value, as by Value::description().
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Value& val);

/**
 * Prints the name of the reliability level (e.g., "DATA_LOSS").
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Conversion_reliability val);

/**
 * Prints the name of the Extra_boolean value (e.g., "WEAK_TRUE").
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Extra_boolean val);

/**
 * Reads an Extra_boolean by its name, case-insensitively; unrecognized input yields Extra_boolean::S_EXTRA_FALSE.
 *
 * @param is
 *        Stream from which to read.
 * @param val
 *        Target.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Extra_boolean& val);

} // namespace utopia::generics
