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
#include "utopia/generics/value_parser.hpp"

namespace utopia::generics
{

Value_parser::~Value_parser() = default;

Value_parser::Type_set Value_parser::input_types() const
{
  Type_set types;
  for (const auto& conversion : conversions())
  {
    types.insert(conversion.m_from);
  }
  return types;
}

Value_parser::Type_set Value_parser::output_types() const
{
  Type_set types;
  for (const auto& conversion : conversions())
  {
    types.insert(conversion.m_to);
  }
  return types;
}

} // namespace utopia::generics
