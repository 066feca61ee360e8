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

#include "utopia/generics/value.hpp"

namespace utopia::generics
{

// Free functions.

/**
 * Determines the type in which a binary operation on operands of types `type1` and `type2` is carried out:
 *   - Equal types: that type.
 *   - Both numbers: the wider of INTEGER < LONG < DOUBLE, where NUMBER counts as DOUBLE.
 *   - Otherwise: whichever of the two types the other converts to more reliably (per
 *     Data_type_registry::conversion_reliability()); on a tie, `type1`.  If that best reliability is DANGEROUS or
 *     NO_CONVERSION, the operands cannot be unified.
 *
 * @param registry
 *        Registry.
 * @param type1
 *        Left operand type.
 * @param type2
 *        Right operand type.
 * @param err_code
 *        See utopia::Error_code docs for error reporting semantics.  Generated error codes:
 *        generics::error::Code::S_OPERATION_NOT_SUPPORTED.
 * @return See above.
 */
Data_type unify_operand_types(const Data_type_registry& registry, const Data_type& type1, const Data_type& type2,
                              Error_code* err_code = 0);

/**
 * Sum: numbers add in the unified type (see unify_operand_types()); STRING concatenates; BOOLEAN is logical OR.
 *
 * @param registry
 *        Registry.
 * @param val1
 *        Left operand.
 * @param val2
 *        Right operand.
 * @param err_code
 *        See utopia::Error_code docs for error reporting semantics.  Generated error codes:
 *        generics::error::Code::S_NULL_VALUE (either operand is null),
 *        generics::error::Code::S_OPERATION_NOT_SUPPORTED (no unified type, no such operation in the unified
 *        type, or integer overflow), plus anything Data_type_registry::convert() generates.
 * @return The result, of the unified type.
 */
Value plus(const Data_type_registry& registry, const Value& val1, const Value& val2, Error_code* err_code = 0);

/**
 * Difference; numbers only.  See plus().
 *
 * @param registry
 *        Registry.
 * @param val1
 *        Left operand.
 * @param val2
 *        Right operand.
 * @param err_code
 *        See plus().
 * @return See plus().
 */
Value minus(const Data_type_registry& registry, const Value& val1, const Value& val2, Error_code* err_code = 0);

/**
 * Product: numbers multiply; BOOLEAN is logical AND.  See plus().
 *
 * @param registry
 *        Registry.
 * @param val1
 *        Left operand.
 * @param val2
 *        Right operand.
 * @param err_code
 *        See plus().
 * @return See plus().
 */
Value multiply(const Data_type_registry& registry, const Value& val1, const Value& val2, Error_code* err_code = 0);

/**
 * Quotient; numbers only.  Integer types truncate toward zero.  See plus().
 *
 * @param registry
 *        Registry.
 * @param val1
 *        Left operand.
 * @param val2
 *        Right operand.
 * @param err_code
 *        See plus().  Additionally: generics::error::Code::S_DIVISION_BY_ZERO.
 * @return See plus().
 */
Value divide(const Data_type_registry& registry, const Value& val1, const Value& val2, Error_code* err_code = 0);

} // namespace utopia::generics
