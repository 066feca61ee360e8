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

#include "utopia/common.hpp"

/**
 * Namespace containing the utopia::generics module's extension of boost.system error conventions, so that that
 * module's API can return codes/messages from within its own new set of error codes/messages.  Historically this
 * was written after boost.asio's error facility, with the same pattern: an `enum`, a Category (in the .cpp), and
 * `make_error_code()` plus the `is_error_code_enum` specialization that glue them to utopia::Error_code.
 *
 * So: `Error_code ec = generics::error::Code::S_NULL_VALUE;` works; and `ec.message()` gives the string below.
 */
namespace utopia::generics::error
{

// Types.

/// All possible errors returned (via utopia::Error_code arguments) by utopia::generics functions/methods.
enum class Code
{
  /// A data type was used that was never registered in the registry.
  S_DATA_TYPE_NOT_REGISTERED = 1,
  /// Registering a data type with the given parent would create a cycle in the type hierarchy.
  S_DATA_TYPE_HIERARCHY_CYCLE,
  /// No registered value parser can convert between the given data types.
  S_NO_PARSER_FOR_CONVERSION,
  /// A value parser was selected but could not convert the given value.
  S_VALUE_PARSE_FAILED,
  /// The value is null, and the operation requires a payload.
  S_NULL_VALUE,
  /// The operation is not supported for the given operand data types.
  S_OPERATION_NOT_SUPPORTED,
  /// Division by zero.
  S_DIVISION_BY_ZERO
}; // enum class Code

// Free functions.

/**
 * Given a `Code` `enum` value, creates a lightweight utopia::Error_code (boost.system `error_code`)
 * representing that error.  This is needed to make the `Error_code ec = Code::...` syntax work.
 *
 * @param err_code
 *        `enum` value.
 * @return See above.
 */
Error_code make_error_code(Code err_code);

} // namespace utopia::generics::error

/// We may add some ADL-based overloads into this namespace outside `utopia`.
namespace boost::system
{

// Types.

/**
 * Ummm -- it specializes this `struct` to -- look -- the end result is boost.system uses this as
 * authorization to make `enum` `Code` convertible to utopia::Error_code.
 */
template<>
struct is_error_code_enum<::utopia::generics::error::Code>
{
  /// Means `Code` `enum` values can be used for utopia::Error_code.
  static const bool value = true;
};

} // namespace boost::system
