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
#include "utopia/generics/value_operations.hpp"
#include "utopia/generics/data_type_registry.hpp"
#include "utopia/generics/error/error.hpp"
#include <flow/error/error.hpp>
#include <algorithm>
#include <limits>
#include <ostream>

namespace utopia::generics
{

namespace
{

/// The binary operations.
enum class Operation
{
  /// plus().
  S_PLUS,
  /// minus().
  S_MINUS,
  /// multiply().
  S_MULTIPLY,
  /// divide().
  S_DIVIDE
};

std::ostream& operator<<(std::ostream& os, Operation val)
{
  switch (val)
  {
  case Operation::S_PLUS: return os << "plus";
  case Operation::S_MINUS: return os << "minus";
  case Operation::S_MULTIPLY: return os << "multiply";
  case Operation::S_DIVIDE: return os << "divide";
  }
  return os << "UNKNOWN";
}

/**
 * Position of a number type in the widening order; DOUBLE and NUMBER share the top.
 *
 * @param type
 *        A number type.
 * @return See above.
 */
int number_rank(const Data_type& type)
{
  if (type == basic_types::integer())
  {
    return 0;
  }
  if (type == basic_types::long_())
  {
    return 1;
  }
  return 2;
}

/**
 * Overflow-checked integer arithmetic in `Int`.
 *
 * @tparam Int
 *         `int32_t` or `int64_t`.
 * @param op
 *        Operation.
 * @param val1
 *        Left operand.
 * @param val2
 *        Right operand; nonzero for S_DIVIDE.
 * @param result
 *        Result.
 * @return `false` on overflow.
 */
template<typename Int>
bool integer_arithmetic(Operation op, Int val1, Int val2, Int* result)
{
  using limits = std::numeric_limits<Int>;
  constexpr Int MAX = limits::max();
  constexpr Int MIN = limits::min();

  switch (op)
  {
  case Operation::S_PLUS:
    if (((val2 > 0) && (val1 > MAX - val2)) || ((val2 < 0) && (val1 < MIN - val2)))
    {
      return false;
    }
    *result = val1 + val2;
    return true;
  case Operation::S_MINUS:
    if (((val2 < 0) && (val1 > MAX + val2)) || ((val2 > 0) && (val1 < MIN + val2)))
    {
      return false;
    }
    *result = val1 - val2;
    return true;
  case Operation::S_MULTIPLY:
    if (val1 > 0)
    {
      if (((val2 > 0) && (val1 > MAX / val2)) || ((val2 <= 0) && (val2 < MIN / val1)))
      {
        return false;
      }
    }
    else if (val1 < 0)
    {
      if (((val2 > 0) && (val1 < MIN / val2)) || ((val2 < 0) && (val2 < MAX / val1)))
      {
        return false;
      }
    }
    *result = val1 * val2;
    return true;
  case Operation::S_DIVIDE:
    if ((val1 == MIN) && (val2 == -1))
    {
      return false;
    }
    *result = val1 / val2;
    return true;
  }
  return false;
} // integer_arithmetic()

/**
 * The operation on two non-null operands already converted to `type`.
 *
 * @param registry
 *        Registry (for its logger).
 * @param op
 *        Operation.
 * @param type
 *        Unified type.
 * @param val1
 *        Left operand, of `type`.
 * @param val2
 *        Right operand, of `type`.
 * @param err_code
 *        Not null.
 * @return See above.
 */
Value apply_in_type(const Data_type_registry& registry, Operation op, const Data_type& type,
                    const Value& val1, const Value& val2, Error_code* err_code)
{
  using boost::any_cast;
  namespace types = basic_types;
  FLOW_LOG_SET_CONTEXT(registry.get_logger(), Log_component::S_GENERICS);

  const auto& payload1 = val1.raw();
  const auto& payload2 = val2.raw();

  if (types::is_number(type))
  {
    // Division by zero first: it is its own error, whatever the number shape.
    if (op == Operation::S_DIVIDE)
    {
      const bool zero = (any_cast<int32_t>(&payload2) && (any_cast<int32_t>(payload2) == 0))
                        || (any_cast<int64_t>(&payload2) && (any_cast<int64_t>(payload2) == 0))
                        || (any_cast<double>(&payload2) && (any_cast<double>(payload2) == 0));
      if (zero)
      {
        FLOW_LOG_WARNING("Cannot divide [" << val1 << "] by zero.");
        FLOW_ERROR_EMIT_ERROR(error::Code::S_DIVISION_BY_ZERO);
        return Value();
      }
    }

    const auto int1 = any_cast<int32_t>(&payload1);
    const auto int2 = any_cast<int32_t>(&payload2);
    const auto long1 = any_cast<int64_t>(&payload1);
    const auto long2 = any_cast<int64_t>(&payload2);
    const auto double1 = any_cast<double>(&payload1);
    const auto double2 = any_cast<double>(&payload2);

    if (int1 && int2)
    {
      int32_t result;
      if (integer_arithmetic(op, *int1, *int2, &result))
      {
        return Value(result, type);
      }
    }
    else if (long1 && long2)
    {
      int64_t result;
      if (integer_arithmetic(op, *long1, *long2, &result))
      {
        return Value(result, type);
      }
    }
    else if (double1 && double2)
    {
      switch (op)
      {
      case Operation::S_PLUS: return Value(*double1 + *double2, type);
      case Operation::S_MINUS: return Value(*double1 - *double2, type);
      case Operation::S_MULTIPLY: return Value(*double1 * *double2, type);
      case Operation::S_DIVIDE: return Value(*double1 / *double2, type);
      }
    }

    FLOW_LOG_WARNING("Operation [" << op << "] on [" << val1 << "] and [" << val2 << "] overflowed or found "
                       "unexpected payload shapes.");
    FLOW_ERROR_EMIT_ERROR(error::Code::S_OPERATION_NOT_SUPPORTED);
    return Value();
  } // if (types::is_number(type))

  const auto str1 = any_cast<std::string>(&payload1);
  const auto str2 = any_cast<std::string>(&payload2);
  if ((type == types::string()) && (op == Operation::S_PLUS) && str1 && str2)
  {
    return Value(*str1 + *str2, type);
  }

  const auto bool1 = any_cast<bool>(&payload1);
  const auto bool2 = any_cast<bool>(&payload2);
  if ((type == types::boolean()) && bool1 && bool2)
  {
    if (op == Operation::S_PLUS)
    {
      return Value(*bool1 || *bool2, type);
    }
    if (op == Operation::S_MULTIPLY)
    {
      return Value(*bool1 && *bool2, type);
    }
  }

  FLOW_LOG_WARNING("Operation [" << op << "] is not supported for type [" << type << "] "
                     "(operands [" << val1 << "] and [" << val2 << "]).");
  FLOW_ERROR_EMIT_ERROR(error::Code::S_OPERATION_NOT_SUPPORTED);
  return Value();
} // apply_in_type()

/**
 * Common body of plus() and friends, in non-null `err_code` mode.
 *
 * @param registry
 *        Registry.
 * @param op
 *        Operation.
 * @param val1
 *        Left operand.
 * @param val2
 *        Right operand.
 * @param err_code
 *        Not null.
 * @return See plus().
 */
Value apply(const Data_type_registry& registry, Operation op, const Value& val1, const Value& val2,
            Error_code* err_code)
{
  FLOW_LOG_SET_CONTEXT(registry.get_logger(), Log_component::S_GENERICS);

  if (val1.is_null() || val2.is_null())
  {
    FLOW_LOG_WARNING("Operation [" << op << "] on [" << val1 << "] and [" << val2 << "]: null operand.");
    FLOW_ERROR_EMIT_ERROR(error::Code::S_NULL_VALUE);
    return Value();
  }
  // else

  const auto type = unify_operand_types(registry, val1.type(), val2.type(), err_code);
  if (*err_code)
  {
    return Value();
  }
  // else

  const auto converted1 = registry.convert(val1, type, err_code);
  if (*err_code)
  {
    return Value();
  }
  const auto converted2 = registry.convert(val2, type, err_code);
  if (*err_code)
  {
    return Value();
  }

  FLOW_LOG_TRACE("Operation [" << op << "] on [" << val1 << "] and [" << val2 << "] carried out in "
                   "type [" << type << "].");
  return apply_in_type(registry, op, type, converted1, converted2, err_code);
} // apply()

} // namespace (anon)

Data_type unify_operand_types(const Data_type_registry& registry, const Data_type& type1, const Data_type& type2,
                              Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Data_type, unify_operand_types, registry, type1, type2, _1);
  // We are in non-null err_code mode.
  err_code->clear();

  namespace types = basic_types;
  FLOW_LOG_SET_CONTEXT(registry.get_logger(), Log_component::S_GENERICS);

  if (type1 == type2)
  {
    return type1;
  }
  // else
  if (types::is_number(type1) && types::is_number(type2))
  {
    const int rank = std::max(number_rank(type1), number_rank(type2));
    return (rank == 0) ? types::integer() : ((rank == 1) ? types::long_() : types::double_());
  }
  // else

  const auto one_to_two = registry.conversion_reliability(type1, type2);
  const auto two_to_one = registry.conversion_reliability(type2, type1);
  const bool toward_two = is_better_than(one_to_two, two_to_one);
  const auto& chosen = toward_two ? type2 : type1;
  const auto reliability = toward_two ? one_to_two : two_to_one;

  if (!is_better_than(reliability, Conversion_reliability::S_DANGEROUS))
  {
    FLOW_LOG_WARNING("Cannot unify operand types [" << type1 << "] and [" << type2 << "]: the best conversion, "
                       "to [" << chosen << "], is [" << reliability << "].");
    FLOW_ERROR_EMIT_ERROR(error::Code::S_OPERATION_NOT_SUPPORTED);
    return Data_type();
  }
  return chosen;
} // unify_operand_types()

Value plus(const Data_type_registry& registry, const Value& val1, const Value& val2, Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Value, plus, registry, val1, val2, _1);
  return apply(registry, Operation::S_PLUS, val1, val2, err_code);
}

Value minus(const Data_type_registry& registry, const Value& val1, const Value& val2, Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Value, minus, registry, val1, val2, _1);
  return apply(registry, Operation::S_MINUS, val1, val2, err_code);
}

Value multiply(const Data_type_registry& registry, const Value& val1, const Value& val2, Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Value, multiply, registry, val1, val2, _1);
  return apply(registry, Operation::S_MULTIPLY, val1, val2, err_code);
}

Value divide(const Data_type_registry& registry, const Value& val1, const Value& val2, Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Value, divide, registry, val1, val2, _1);
  return apply(registry, Operation::S_DIVIDE, val1, val2, err_code);
}

} // namespace utopia::generics
