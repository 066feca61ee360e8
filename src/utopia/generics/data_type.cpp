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
#include "utopia/generics/data_type.hpp"
#include <boost/functional/hash.hpp>
#include <ostream>

namespace utopia::generics
{

// Data_type implementations.

Data_type::Data_type() = default;

Data_type::Data_type(util::String_view name) :
  m_name(name)
{
  // Nothing else.
}

const std::string& Data_type::name() const
{
  return m_name;
}

bool Data_type::untyped() const
{
  return m_name.empty();
}

bool operator==(const Data_type& val1, const Data_type& val2)
{
  return val1.name() == val2.name();
}

bool operator!=(const Data_type& val1, const Data_type& val2)
{
  return !(val1 == val2);
}

bool operator<(const Data_type& val1, const Data_type& val2)
{
  return val1.name() < val2.name();
}

size_t hash_value(const Data_type& val)
{
  return boost::hash<std::string>()(val.name());
}

std::ostream& operator<<(std::ostream& os, const Data_type& val)
{
  return os << (val.untyped() ? "UNTYPED" : val.name());
}

// basic_types implementations.

namespace basic_types
{

const Data_type& string()
{
  static const Data_type s_type("STRING");
  return s_type;
}

const Data_type& number()
{
  static const Data_type s_type("NUMBER");
  return s_type;
}

const Data_type& long_()
{
  static const Data_type s_type("LONG");
  return s_type;
}

const Data_type& integer()
{
  static const Data_type s_type("INTEGER");
  return s_type;
}

const Data_type& double_()
{
  static const Data_type s_type("DOUBLE");
  return s_type;
}

const Data_type& boolean()
{
  static const Data_type s_type("BOOLEAN");
  return s_type;
}

const Data_type& extra_boolean()
{
  static const Data_type s_type("EXTRA_BOOLEAN");
  return s_type;
}

const Data_type& date()
{
  static const Data_type s_type("DATE");
  return s_type;
}

const Data_type& date_time()
{
  static const Data_type s_type("DATETIME");
  return s_type;
}

const Data_type& variable()
{
  static const Data_type s_type("VARIABLE");
  return s_type;
}

const Data_type& model()
{
  static const Data_type s_type("MODEL");
  return s_type;
}

bool is_number(const Data_type& type)
{
  return (type == integer()) || (type == long_()) || (type == double_()) || (type == number());
}

} // namespace basic_types

} // namespace utopia::generics
