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
#include "utopia/generics/extra_boolean.hpp"
#include <flow/util/util.hpp>
#include <boost/algorithm/string.hpp>
#include <cmath>
#include <ostream>
#include <istream>

namespace utopia::generics
{

double extra_boolean_value(Extra_boolean val)
{
  switch (val)
  {
  case Extra_boolean::S_EXTRA_FALSE: return 0.0;
  case Extra_boolean::S_WEAK_FALSE: return 0.3;
  case Extra_boolean::S_WEAK_TRUE: return 0.6;
  case Extra_boolean::S_EXTRA_TRUE: return 1.0;
  case Extra_boolean::S_END_SENTINEL: break;
  }
  return 0.0;
}

bool to_boolean(Extra_boolean val)
{
  return extra_boolean_value(val) >= 0.5;
}

bool is_at_least_as_true_as(Extra_boolean val1, Extra_boolean val2)
{
  return extra_boolean_value(val1) >= extra_boolean_value(val2);
}

Extra_boolean equals(Extra_boolean val1, Extra_boolean val2)
{
  if (val1 == val2)
  {
    return Extra_boolean::S_EXTRA_TRUE;
  }
  if (to_boolean(val1) == to_boolean(val2))
  {
    return Extra_boolean::S_WEAK_TRUE;
  }
  if (std::fabs(extra_boolean_value(val1) - extra_boolean_value(val2)) < 0.5)
  {
    return Extra_boolean::S_WEAK_FALSE;
  }
  return Extra_boolean::S_EXTRA_FALSE;
}

Extra_boolean extra_boolean_from_double(double val)
{
  // Careful: NaN fails every comparison; check it explicitly rather than let it fall through to EXTRA_TRUE.
  if (std::isnan(val) || (val <= 0))
  {
    return Extra_boolean::S_EXTRA_FALSE;
  }
  if (val <= 0.3)
  {
    return Extra_boolean::S_WEAK_FALSE;
  }
  if (val <= 0.6)
  {
    return Extra_boolean::S_WEAK_TRUE;
  }
  return Extra_boolean::S_EXTRA_TRUE;
}

Extra_boolean extra_boolean_from_bool(bool val)
{
  return val ? Extra_boolean::S_EXTRA_TRUE : Extra_boolean::S_EXTRA_FALSE;
}

bool parse_extra_boolean(util::String_view str, Extra_boolean* result)
{
  const auto trimmed = boost::algorithm::trim_copy(std::string(str));

  if (boost::algorithm::iequals(trimmed, "true"))
  {
    *result = Extra_boolean::S_EXTRA_TRUE;
    return true;
  }
  if (boost::algorithm::iequals(trimmed, "false"))
  {
    *result = Extra_boolean::S_EXTRA_FALSE;
    return true;
  }

  for (auto val = Extra_boolean::S_EXTRA_FALSE; val != Extra_boolean::S_END_SENTINEL;
       val = Extra_boolean(int(val) + 1))
  {
    if (boost::algorithm::iequals(trimmed, util::ostream_op_string(val)))
    {
      *result = val;
      return true;
    }
  }
  return false;
} // parse_extra_boolean()

std::ostream& operator<<(std::ostream& os, Extra_boolean val)
{
  switch (val)
  {
  case Extra_boolean::S_EXTRA_FALSE: return os << "EXTRA_FALSE";
  case Extra_boolean::S_WEAK_FALSE: return os << "WEAK_FALSE";
  case Extra_boolean::S_WEAK_TRUE: return os << "WEAK_TRUE";
  case Extra_boolean::S_EXTRA_TRUE: return os << "EXTRA_TRUE";
  case Extra_boolean::S_END_SENTINEL: break;
  }
  return os << "UNKNOWN";
}

std::istream& operator>>(std::istream& is, Extra_boolean& val)
{
  // Names contain only [A-Z_], so the stock enum reader handles it; numeric encodings are not accepted.
  val = util::istream_to_enum(&is, Extra_boolean::S_EXTRA_FALSE, Extra_boolean::S_END_SENTINEL, false);
  return is;
}

} // namespace utopia::generics
