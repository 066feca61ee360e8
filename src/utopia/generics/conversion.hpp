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

#include "utopia/generics/data_type.hpp"

namespace utopia::generics
{

// Types.

/**
 * How much is lost by converting a value from one Data_type to another.  Each level other than `S_NO_CONVERSION` is
 * also a per-step cost (its underlying value): a multi-step route costs the sum of its steps, and the
 * registry prefers the cheapest route.  A lower cost is better.
 */
enum class Conversion_reliability
{
  /// Nothing is lost.  Cost 1.
  S_PERFECT = 1,
  /// Precision or range may be lost (e.g., DOUBLE to INTEGER).  Cost 7.
  S_DATA_LOSS = 7,
  /// The result means something different (e.g., BOOLEAN to INTEGER).  Cost 25.
  S_MEANING_LOSS = 25,
  /// The result may not exist at all (e.g., STRING to anything).  Cost 30.
  S_DANGEROUS = 30,
  /// Impossible; not a step.  Its underlying value exceeds every real level so that worse-than comparisons work.
  S_NO_CONVERSION = 1000
}; // enum class Conversion_reliability

/**
 * One conversion a Value_parser declares it supports.  Trivially copyable aggregate.
 */
struct Conversion
{
  /// Source type.
  Data_type m_from;
  /// Target type.
  Data_type m_to;
  /// How lossy it is.
  Conversion_reliability m_reliability;
};

// Free functions.

/**
 * Per-step cost of the given level, or -1 for Conversion_reliability::S_NO_CONVERSION.
 *
 * @param reliability
 *        Level.
 * @return See above.
 */
int conversion_step_cost(Conversion_reliability reliability);

/**
 * `true` if and only if `val1` is strictly better (cheaper) than `val2`.
 *
 * @param val1
 *        Level.
 * @param val2
 *        Level.
 * @return See above.
 */
bool is_better_than(Conversion_reliability val1, Conversion_reliability val2);

/**
 * The worse of the two levels.
 *
 * @param val1
 *        Level.
 * @param val2
 *        Level.
 * @return See above.
 */
Conversion_reliability worse_of(Conversion_reliability val1, Conversion_reliability val2);

/**
 * Prints "<from> -> <to> (<reliability>)".
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Conversion& val);

} // namespace utopia::generics
