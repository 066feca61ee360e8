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
#include "utopia/recording/error/error.hpp"

namespace utopia::recording::error
{

// Types.

/**
 * The boost.system category for errors returned by the utopia::recording module.  Its logic is accessed indirectly
 * through standard boost.system machinery (`Error_code::category().name()` and `Error_code::message()`).
 */
class Category :
  public boost::system::error_category
{
public:
  // Constants.

  /// The one Category.
  static const Category S_CATEGORY;

  // Methods.

  /**
   * Implements superclass API: returns a `static` string representing this `error_category`.
   *
   * @return A `static` string that's a brief description of this error category.
   */
  const char* name() const noexcept override;

  /**
   * Implements superclass API: given the integer error code of an error in this category, returns a description of
   * that error.
   *
   * @param val
   *        Error code of a Category error (realistically, an error::Code `enum` value cast to `int`).
   * @return String describing the error.
   */
  std::string message(int val) const override;

private:
  // Constructors.

  /// Boring constructor.
  explicit Category();
}; // class Category

// Static initializations.

const Category Category::S_CATEGORY;

// Implementations.

Error_code make_error_code(Code err_code)
{
  return Error_code{static_cast<int>(err_code), Category::S_CATEGORY};
}

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "utopia/recording";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENT IN error.hpp ON THE INDIVIDUAL ENUM MEMBERS!
  switch (static_cast<Code>(val))
  {
  case Code::S_DUPLICATE_ID:
    return "An object with the given ID was already created in this session.";
  case Code::S_NO_CONSTRUCT_YET:
    return "An attribute or link was given before any object was created.";
  case Code::S_UNKNOWN_ID:
    return "No object with the given ID exists in this session.";
  case Code::S_CONSTRUCT_CREATION_FAILED:
    return "The object factory did not produce an object.";
  case Code::S_MALFORMED_LINE:
    return "A recording line is neither an ID, an instruction, nor a well-formed key=value pair.";
  case Code::S_MALFORMED_XML:
    return "The XML document could not be parsed.";
  case Code::S_MALFORMED_XML_STRUCTURE:
    return "The XML document is well-formed but its element structure is not a valid recording.";
  case Code::S_FILE_NOT_FOUND:
    return "The file does not exist or cannot be opened.";
  case Code::S_UNRESOLVED_LINKS:
    return "Links to objects that were never created remain at the end of the session.";
  case Code::S_UNWRITABLE_TEXT:
    return "An attribute name or value cannot be represented in the text recording format.";
  case Code::S_XML_DOCUMENT_ALREADY_OPEN:
    return "An XML document is already open in this writer.";
  }
  return "Unknown utopia/recording error.";
} // Category::message()

} // namespace utopia::recording::error
