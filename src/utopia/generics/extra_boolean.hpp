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

#include "utopia/generics/generics_fwd.hpp"

namespace utopia::generics
{

// Types.

/**
 * A four-valued truthiness, for when `bool` says too little.  Each value has a numeric weight (see
 * extra_boolean_value()); the two `*_TRUE` values are truthy (to_boolean()), the two `*_FALSE` values falsy.
 *
 * The enumerators are in ascending weight order, so `<` among them means "less true than."
 */
enum class Extra_boolean
{
  /// Weight 0.0.
  S_EXTRA_FALSE = 0,
  /// Weight 0.3.
  S_WEAK_FALSE,
  /// Weight 0.6.
  S_WEAK_TRUE,
  /// Weight 1.0.
  S_EXTRA_TRUE,
  /// Sentinel: not a value.
  S_END_SENTINEL
}; // enum class Extra_boolean

// Free functions.

/**
 * The numeric weight: 0.0, 0.3, 0.6, 1.0 respectively.
 *
 * @param val
 *        Value; not the sentinel.
 * @return See above.
 */
double extra_boolean_value(Extra_boolean val);

/**
 * `true` if and only if the weight is at least 0.5.
 *
 * @param val
 *        Value.
 * @return See above.
 */
bool to_boolean(Extra_boolean val);

/**
 * `true` if and only if `val1` weighs no less than `val2`.
 *
 * @param val1
 *        Value.
 * @param val2
 *        Value.
 * @return See above.
 */
bool is_at_least_as_true_as(Extra_boolean val1, Extra_boolean val2);

/**
 * Fuzzy equality: EXTRA_TRUE if identical; else WEAK_TRUE if same truthiness; else WEAK_FALSE if the weights
 * differ by less than 0.5; else EXTRA_FALSE.
 *
 * @param val1
 *        Value.
 * @param val2
 *        Value.
 * @return See above.
 */
Extra_boolean equals(Extra_boolean val1, Extra_boolean val2);

/**
 * Maps a weight to the value using thresholds: `<= 0` is EXTRA_FALSE, `<= 0.3` is WEAK_FALSE, `<= 0.6` is
 * WEAK_TRUE, anything above is EXTRA_TRUE.  NaN maps to EXTRA_FALSE.
 *
 * @param val
 *        Weight.
 * @return See above.
 */
Extra_boolean extra_boolean_from_double(double val);

/**
 * EXTRA_TRUE or EXTRA_FALSE.
 *
 * @param val
 *        Value.
 * @return See above.
 */
Extra_boolean extra_boolean_from_bool(bool val);

/**
 * Parses "true" (EXTRA_TRUE), "false" (EXTRA_FALSE), or a value name as printed by `<<` (e.g., "WEAK_TRUE"); all
 * case-insensitive.  Surrounding whitespace is ignored.
 *
 * @param str
 *        String to parse.
 * @param result
 *        Where to put the value on success; untouched on failure.
 * @return `true` on success; `false` if `str` is none of the above.
 */
bool parse_extra_boolean(util::String_view str, Extra_boolean* result);

} // namespace utopia::generics
