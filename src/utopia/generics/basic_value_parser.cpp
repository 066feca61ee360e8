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
#include "utopia/generics/basic_value_parser.hpp"
#include "utopia/generics/error/error.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast/try_lexical_convert.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <cmath>
#include <limits>

namespace utopia::generics
{

namespace
{

/// A number payload, whichever of the number shapes it came from.
struct Numeric
{
  /// `true` if it came from an integer shape (use `m_int`); else use `m_double`.
  bool m_integral;
  /// See `m_integral`.
  int64_t m_int;
  /// See `m_integral`.
  double m_double;
};

/**
 * Loads `*result` from a number or `bool` payload.
 *
 * @param payload
 *        Payload.
 * @param result
 *        Result.
 * @return `false` if the payload is of no such shape.
 */
bool to_numeric(const boost::any& payload, Numeric* result)
{
  using boost::any_cast;

  if (const auto val = any_cast<int32_t>(&payload))
  {
    *result = { true, *val, 0 };
  }
  else if (const auto val = any_cast<int64_t>(&payload))
  {
    *result = { true, *val, 0 };
  }
  else if (const auto val = any_cast<double>(&payload))
  {
    *result = { false, 0, *val };
  }
  else if (const auto val = any_cast<bool>(&payload))
  {
    *result = { true, *val ? 1 : 0, 0 };
  }
  else
  {
    return false;
  }
  return true;
}

/**
 * Truncates toward zero into `int64_t`.
 *
 * @param val
 *        Source.
 * @param result
 *        Result.
 * @return `false` if not finite or out of range.
 */
bool truncate_to_int64(double val, int64_t* result)
{
  // 2^63 is exactly representable as a double; anything at or beyond it (or NaN) does not fit.
  constexpr double LIMIT = 9223372036854775808.0;
  const double truncated = std::trunc(val);
  if (!((truncated >= -LIMIT) && (truncated < LIMIT)))
  {
    return false;
  }
  *result = int64_t(truncated);
  return true;
}

/**
 * Range-checked narrowing to `int32_t`.
 *
 * @param val
 *        Source.
 * @param result
 *        Result.
 * @return `false` if out of range.
 */
bool narrow_to_int32(int64_t val, int32_t* result)
{
  using limits = std::numeric_limits<int32_t>;
  if ((val < limits::min()) || (val > limits::max()))
  {
    return false;
  }
  *result = int32_t(val);
  return true;
}

/**
 * Numeric (or `bool`) to any basic non-STRING type.
 *
 * @param num
 *        Source.
 * @param to
 *        Target type.
 * @return The payload; empty on failure.
 */
boost::any convert_numeric(const Numeric& num, const Data_type& to)
{
  namespace types = basic_types;

  int64_t as_long = num.m_int;
  if ((to == types::integer()) || (to == types::long_()))
  {
    if ((!num.m_integral) && (!truncate_to_int64(num.m_double, &as_long)))
    {
      return boost::any();
    }
    if (to == types::long_())
    {
      return as_long;
    }
    int32_t as_int;
    return narrow_to_int32(as_long, &as_int) ? boost::any(as_int) : boost::any();
  }
  // else
  const double as_double = num.m_integral ? double(num.m_int) : num.m_double;
  if ((to == types::double_()) || (to == types::number()))
  {
    return as_double;
  }
  if (to == types::boolean())
  {
    return as_double != 0;
  }
  if (to == types::extra_boolean())
  {
    return extra_boolean_from_double(as_double);
  }
  return boost::any();
} // convert_numeric()

/**
 * STRING to any basic non-STRING type.
 *
 * @param str
 *        Source; untrimmed.
 * @param to
 *        Target type.
 * @return The payload; empty on failure.
 */
boost::any parse_string(const std::string& str, const Data_type& to)
{
  namespace types = basic_types;
  using boost::conversion::try_lexical_convert;
  using boost::algorithm::iequals;

  const auto trimmed = boost::algorithm::trim_copy(str);

  if ((to == types::integer()) || (to == types::long_()))
  {
    Numeric num{ true, 0, 0 };
    if (!try_lexical_convert(trimmed, num.m_int))
    {
      num.m_integral = false;
      if (!try_lexical_convert(trimmed, num.m_double))
      {
        return boost::any();
      }
    }
    return convert_numeric(num, to);
  }
  // else
  if ((to == types::double_()) || (to == types::number()))
  {
    double val;
    return try_lexical_convert(trimmed, val) ? boost::any(val) : boost::any();
  }
  if (to == types::boolean())
  {
    if (iequals(trimmed, "true") || (trimmed == "1"))
    {
      return true;
    }
    if (iequals(trimmed, "false") || (trimmed == "0"))
    {
      return false;
    }
    return boost::any();
  }
  if (to == types::extra_boolean())
  {
    Extra_boolean val;
    return parse_extra_boolean(trimmed, &val) ? boost::any(val) : boost::any();
  }

  // The date_time parsers throw on malformed input; that becomes a plain failure here.
  if (to == types::date())
  {
    try
    {
      const auto val = boost::gregorian::from_string(trimmed);
      return val.is_special() ? boost::any() : boost::any(val);
    }
    catch (const std::exception&)
    {
      return boost::any();
    }
  }
  if (to == types::date_time())
  {
    try
    {
      const auto val = boost::posix_time::from_iso_extended_string(trimmed);
      return val.is_special() ? boost::any() : boost::any(val);
    }
    catch (const std::exception&)
    {
      return boost::any();
    }
  }
  return boost::any();
} // parse_string()

/**
 * EXTRA_BOOLEAN to BOOLEAN or a number type.
 *
 * @param val
 *        Source.
 * @param to
 *        Target type.
 * @return The payload; empty on failure.
 */
boost::any convert_extra_boolean(Extra_boolean val, const Data_type& to)
{
  namespace types = basic_types;

  if (to == types::boolean())
  {
    return to_boolean(val);
  }
  if ((to == types::double_()) || (to == types::number()))
  {
    return extra_boolean_value(val);
  }
  if (to == types::integer())
  {
    return int32_t(to_boolean(val) ? 1 : 0);
  }
  if (to == types::long_())
  {
    return int64_t(to_boolean(val) ? 1 : 0);
  }
  return boost::any();
}

} // namespace (anon)

// Basic_value_parser implementations.

Basic_value_parser::Basic_value_parser(flow::log::Logger* logger_ptr) :
  flow::log::Log_context(logger_ptr, Log_component::S_GENERICS)
{
  namespace types = basic_types;
  using R = Conversion_reliability;

  const auto add = [&](const Data_type& from, const Data_type& to, R reliability)
  {
    m_conversions.push_back({ from, to, reliability });
  };

  const Data_type* const value_types[]
    = { &types::integer(), &types::long_(), &types::double_(), &types::number(), &types::boolean(),
        &types::extra_boolean(), &types::date(), &types::date_time() };
  for (const auto type : value_types)
  {
    add(*type, types::string(), R::S_PERFECT);
    add(types::string(), *type, R::S_DANGEROUS);
  }

  add(types::integer(), types::number(), R::S_PERFECT);
  add(types::long_(), types::number(), R::S_PERFECT);
  add(types::double_(), types::number(), R::S_PERFECT);
  add(types::number(), types::double_(), R::S_PERFECT);
  add(types::number(), types::integer(), R::S_DATA_LOSS);
  add(types::number(), types::long_(), R::S_DATA_LOSS);
  add(types::integer(), types::long_(), R::S_PERFECT);
  add(types::integer(), types::double_(), R::S_PERFECT);
  add(types::long_(), types::integer(), R::S_DATA_LOSS);
  add(types::long_(), types::double_(), R::S_DATA_LOSS);
  add(types::double_(), types::integer(), R::S_DATA_LOSS);
  add(types::double_(), types::long_(), R::S_DATA_LOSS);

  for (const auto type : { &types::integer(), &types::long_(), &types::double_(), &types::number() })
  {
    add(types::boolean(), *type, R::S_MEANING_LOSS);
    add(*type, types::boolean(), R::S_MEANING_LOSS);
  }

  add(types::boolean(), types::extra_boolean(), R::S_PERFECT);
  add(types::extra_boolean(), types::boolean(), R::S_DATA_LOSS);
  add(types::extra_boolean(), types::double_(), R::S_PERFECT);
  add(types::extra_boolean(), types::integer(), R::S_MEANING_LOSS);
  add(types::extra_boolean(), types::long_(), R::S_MEANING_LOSS);
  add(types::double_(), types::extra_boolean(), R::S_MEANING_LOSS);

  add(types::date(), types::date_time(), R::S_PERFECT);
  add(types::date_time(), types::date(), R::S_DATA_LOSS);
} // Basic_value_parser::Basic_value_parser()

std::vector<Conversion> Basic_value_parser::conversions() const
{
  return m_conversions;
}

Value Basic_value_parser::parse(const Value& value, const Data_type& to, Error_code* err_code) const
{
  using boost::any_cast;
  namespace types = basic_types;

  const auto& payload = value.raw();
  boost::any result;

  if (value.type() == to)
  {
    result = payload;
  }
  else if (to == types::string())
  {
    std::string str;
    if (render_basic_payload(payload, &str))
    {
      result = std::move(str);
    }
  }
  else if (const auto str = any_cast<std::string>(&payload))
  {
    result = parse_string(*str, to);
  }
  else if (const auto val = any_cast<Extra_boolean>(&payload))
  {
    result = convert_extra_boolean(*val, to);
  }
  else if (const auto val = any_cast<boost::gregorian::date>(&payload))
  {
    if (to == types::date_time())
    {
      result = boost::posix_time::ptime(*val);
    }
  }
  else if (const auto val = any_cast<boost::posix_time::ptime>(&payload))
  {
    if (to == types::date())
    {
      result = val->date();
    }
  }
  else
  {
    Numeric num;
    if (to_numeric(payload, &num))
    {
      result = convert_numeric(num, to);
    }
  }

  if (result.empty())
  {
    FLOW_LOG_TRACE("Basic parser could not convert [" << value << "] to [" << to << "].");
    *err_code = error::Code::S_VALUE_PARSE_FAILED;
    return Value();
  }
  // else
  return Value(std::move(result), to);
} // Basic_value_parser::parse()

} // namespace utopia::generics
