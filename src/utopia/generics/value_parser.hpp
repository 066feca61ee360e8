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

#include "utopia/generics/conversion.hpp"
#include "utopia/generics/value.hpp"
#include <boost/unordered_set.hpp>
#include <vector>

namespace utopia::generics
{

/**
 * Interface for an object able to convert Value%s from some Data_type%s to others.  A Value_parser declares its
 * supported conversions via conversions(); Data_type_registry derives from that list both the parser's input/output
 * type sets (which decide whether the parser is chosen for a given direct conversion) and the edges of its
 * conversion graph (which decide the cheapest multi-step route).
 *
 * Implementations are installed via Data_type_registry::add_parser() and are then shared (via #Value_parser_ptr)
 * by the registry.  parse() must be `const` and must not depend on mutable state: the registry may call it any
 * number of times, in any order.
 *
 * ### Selection by set, not by pair ###
 * Data_type_registry::convert() chooses the first parser whose input set contains the source type and whose
 * output set contains the target type, even if that exact pair was never declared.  So parse() must cope with
 * (by failing cleanly on) any such pair.
 */
class Value_parser
{
public:
  // Types.

  /// Set of types.
  using Type_set = boost::unordered_set<Data_type>;

  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~Value_parser();

  // Methods.

  /**
   * The conversions this parser supports, each with its reliability.  Must return the same list every time.
   *
   * @return See above.
   */
  virtual std::vector<Conversion> conversions() const = 0;

  /**
   * Converts `value`, a non-null Value, to Data_type `to`.
   *
   * @param value
   *        Source value; not null; its type is the source type.
   * @param to
   *        Target type.
   * @param err_code
   *        Never null.  On failure set to a truthy value, preferably generics::error::Code::S_VALUE_PARSE_FAILED;
   *        the registry reports any parser failure as that code.
   * @return The converted value, of type `to`; meaningless on failure.
   */
  virtual Value parse(const Value& value, const Data_type& to, Error_code* err_code) const = 0;

  /**
   * The set of all `m_from` in conversions().
   *
   * @return See above.
   */
  Type_set input_types() const;

  /**
   * The set of all `m_to` in conversions().
   *
   * @return See above.
   */
  Type_set output_types() const;
}; // class Value_parser

} // namespace utopia::generics
