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
 * Namespace containing the utopia::recording module's extension of boost.system error conventions, following the
 * same pattern as utopia::generics::error.
 */
namespace utopia::recording::error
{

// Types.

/// All possible errors returned (via utopia::Error_code arguments) by utopia::recording functions/methods.
enum class Code
{
  /// An object with the given ID was already created in this session.
  S_DUPLICATE_ID = 1,
  /// An attribute or link was given before any object was created.
  S_NO_CONSTRUCT_YET,
  /// No object with the given ID exists in this session.
  S_UNKNOWN_ID,
  /// The object factory did not produce an object.
  S_CONSTRUCT_CREATION_FAILED,
  /// A recording line is neither an ID, an instruction, nor a well-formed `key=value` pair.
  S_MALFORMED_LINE,
  /// The XML document could not be parsed.
  S_MALFORMED_XML,
  /// The XML document is well-formed but its element structure is not a valid recording.
  S_MALFORMED_XML_STRUCTURE,
  /// The file does not exist or cannot be opened.
  S_FILE_NOT_FOUND,
  /// Links to objects that were never created remain at the end of the session.
  S_UNRESOLVED_LINKS,
  /// An attribute name or value cannot be represented in the text recording format.
  S_UNWRITABLE_TEXT,
  /// An XML document is already open in this writer.
  S_XML_DOCUMENT_ALREADY_OPEN
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

} // namespace utopia::recording::error

/// We may add some ADL-based overloads into this namespace outside `utopia`.
namespace boost::system
{

// Types.

/// Authorizes boost.system to make `enum` `Code` convertible to utopia::Error_code.
template<>
struct is_error_code_enum<::utopia::recording::error::Code>
{
  /// Means `Code` `enum` values can be used for utopia::Error_code.
  static const bool value = true;
};

} // namespace boost::system
