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
#include "utopia/generics/conversion.hpp"
#include <ostream>

namespace utopia::generics
{

int conversion_step_cost(Conversion_reliability reliability)
{
  return (reliability == Conversion_reliability::S_NO_CONVERSION) ? -1 : int(reliability);
}

bool is_better_than(Conversion_reliability val1, Conversion_reliability val2)
{
  return int(val1) < int(val2);
}

Conversion_reliability worse_of(Conversion_reliability val1, Conversion_reliability val2)
{
  return is_better_than(val1, val2) ? val2 : val1;
}

std::ostream& operator<<(std::ostream& os, Conversion_reliability val)
{
  switch (val)
  {
  case Conversion_reliability::S_PERFECT: return os << "PERFECT";
  case Conversion_reliability::S_DATA_LOSS: return os << "DATA_LOSS";
  case Conversion_reliability::S_MEANING_LOSS: return os << "MEANING_LOSS";
  case Conversion_reliability::S_DANGEROUS: return os << "DANGEROUS";
  case Conversion_reliability::S_NO_CONVERSION: return os << "NO_CONVERSION";
  }
  return os << "UNKNOWN";
}

std::ostream& operator<<(std::ostream& os, const Conversion& val)
{
  return os << val.m_from << " -> " << val.m_to << " (" << val.m_reliability << ')';
}

} // namespace utopia::generics
