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
#include "utopia/generics/error/error.hpp"

namespace utopia::generics::error
{

// Types.

/**
 * The boost.system category for errors returned by the utopia::generics module.  Think of it as the polymorphic
 * counterpart of error::Code, and it kicks in when, for `Error_code ec`, something like `ec.message()` is invoked.
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
   * that error (similarly in spirit to `std::strerror()`).
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
  // Glue together Category::name()/message() with the Code enum.
  return Error_code{static_cast<int>(err_code), Category::S_CATEGORY};
}

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "utopia/generics";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENT IN error.hpp ON THE INDIVIDUAL ENUM MEMBERS!
  switch (static_cast<Code>(val))
  {
  case Code::S_DATA_TYPE_NOT_REGISTERED:
    return "A data type was used that was never registered in the registry.";
  case Code::S_DATA_TYPE_HIERARCHY_CYCLE:
    return "Registering a data type with the given parent would create a cycle in the type hierarchy.";
  case Code::S_NO_PARSER_FOR_CONVERSION:
    return "No registered value parser can convert between the given data types.";
  case Code::S_VALUE_PARSE_FAILED:
    return "A value parser was selected but could not convert the given value.";
  case Code::S_NULL_VALUE:
    return "The value is null, and the operation requires a payload.";
  case Code::S_OPERATION_NOT_SUPPORTED:
    return "The operation is not supported for the given operand data types.";
  case Code::S_DIVISION_BY_ZERO:
    return "Division by zero.";
  }
  return "Unknown utopia/generics error.";
} // Category::message()

} // namespace utopia::generics::error
