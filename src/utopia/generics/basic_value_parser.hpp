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

#include "utopia/generics/value_parser.hpp"
#include <flow/log/log.hpp>

namespace utopia::generics
{

/**
 * The Value_parser for the basic types (see generics::basic_types), installed by
 * Data_type_registry::create_with_basic_types().  Its declared conversions and their reliabilities:
 *
 *   - any basic value type to STRING: PERFECT.
 *   - STRING to any basic value type: DANGEROUS.
 *   - INTEGER, LONG, DOUBLE to NUMBER; NUMBER to DOUBLE; INTEGER to LONG, DOUBLE: PERFECT.
 *   - NUMBER to INTEGER, LONG; LONG to INTEGER, DOUBLE; DOUBLE to INTEGER, LONG: DATA_LOSS.
 *   - BOOLEAN to and from each number type: MEANING_LOSS.
 *   - BOOLEAN to EXTRA_BOOLEAN: PERFECT.  EXTRA_BOOLEAN to BOOLEAN: DATA_LOSS.
 *   - EXTRA_BOOLEAN to DOUBLE: PERFECT.  EXTRA_BOOLEAN to INTEGER, LONG: MEANING_LOSS.
 *   - DOUBLE to EXTRA_BOOLEAN: MEANING_LOSS.
 *   - DATE to DATETIME: PERFECT.  DATETIME to DATE: DATA_LOSS.
 *
 * ### Parsing policy ###
 * Strings are trimmed first.  STRING to DOUBLE/NUMBER needs the whole string to be a number.  STRING to
 * INTEGER/LONG first tries an integer; failing that a double, truncated toward zero ("4.2" gives 4); failing that,
 * or out of range, it fails: there is never a silent zero.  STRING to BOOLEAN takes "true"/"false"
 * (case-insensitive) or "1"/"0".  STRING to EXTRA_BOOLEAN: see parse_extra_boolean().  Dates and times use ISO
 * extended form.
 *
 * Numeric narrowing truncates toward zero and fails when out of range.  Numbers to BOOLEAN means nonzero.  Numbers
 * to EXTRA_BOOLEAN goes through extra_boolean_from_double().
 */
class Basic_value_parser :
  public Value_parser,
  public flow::log::Log_context
{
public:
  // Constructors/destructor.

  /**
   * Constructs the parser.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging; null means no logging.
   */
  explicit Basic_value_parser(flow::log::Logger* logger_ptr = 0);

  // Methods.

  /**
   * Implements Value_parser API.
   *
   * @return See above.
   */
  std::vector<Conversion> conversions() const override;

  /**
   * Implements Value_parser API.
   *
   * @param value
   *        See Value_parser::parse().
   * @param to
   *        See Value_parser::parse().
   * @param err_code
   *        See Value_parser::parse().
   * @return See Value_parser::parse().
   */
  Value parse(const Value& value, const Data_type& to, Error_code* err_code) const override;

private:
  // Data.

  /// See conversions().  Filled in constructor.
  std::vector<Conversion> m_conversions;
}; // class Basic_value_parser

} // namespace utopia::generics
