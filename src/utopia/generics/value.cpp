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
#include "utopia/generics/value.hpp"
#include "utopia/generics/data_type_registry.hpp"
#include "utopia/generics/error/error.hpp"
#include <flow/error/error.hpp>
#include <flow/util/util.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <fmt/format.h>
#include <ostream>

namespace utopia::generics
{

namespace
{

/**
 * If both payloads are of shape `T`, sets `*equal` to whether their contents are equal and returns `true`;
 * else returns `false`.
 *
 * @tparam T
 *         Shape.
 * @param payload1
 *        Non-empty payload.
 * @param payload2
 *        Non-empty payload.
 * @param equal
 *        Result.
 * @return See above.
 */
template<typename T>
bool payloads_equal_as(const boost::any& payload1, const boost::any& payload2, bool* equal)
{
  const auto val1 = boost::any_cast<T>(&payload1);
  const auto val2 = boost::any_cast<T>(&payload2);
  if (!(val1 && val2))
  {
    return false;
  }
  *equal = (*val1 == *val2);
  return true;
}

} // namespace (anon)

// Value implementations.

Value::Value() = default;

Value::Value(boost::any payload, const Data_type& type) :
  m_payload(std::move(payload)),
  m_type(type)
{
  // Nothing else.
}

Value Value::of_integer(int32_t val)
{
  return Value(val, basic_types::integer());
}

Value Value::of_long(int64_t val)
{
  return Value(val, basic_types::long_());
}

Value Value::of_double(double val)
{
  return Value(val, basic_types::double_());
}

Value Value::of_number(double val)
{
  return Value(val, basic_types::number());
}

Value Value::of_string(util::String_view val)
{
  return Value(std::string(val), basic_types::string());
}

Value Value::of_boolean(bool val)
{
  return Value(val, basic_types::boolean());
}

Value Value::of_extra_boolean(Extra_boolean val)
{
  return Value(val, basic_types::extra_boolean());
}

Value Value::of_date(const boost::gregorian::date& val)
{
  return Value(val, basic_types::date());
}

Value Value::of_date_time(const boost::posix_time::ptime& val)
{
  return Value(val, basic_types::date_time());
}

Value Value::null(const Data_type& type)
{
  return Value(boost::any(), type);
}

const Data_type& Value::type() const
{
  return m_type;
}

const boost::any& Value::raw() const
{
  return m_payload;
}

bool Value::is_null() const
{
  return m_payload.empty();
}

Value Value::cast_to(const Data_type_registry& registry, const Data_type& target, Error_code* err_code) const
{
  // The registry does the exception-vs-code dance itself, with a more informative context than we could supply.
  return registry.convert(*this, target, err_code);
}

template<typename T>
T Value::cast_and_unwrap(const Data_type_registry& registry, const Data_type& target, Error_code* err_code) const
{
  const auto cast = cast_to(registry, target, err_code);
  if (*err_code)
  {
    return T();
  }
  // else

  if (cast.is_null())
  {
    *err_code = error::Code::S_NULL_VALUE;
    return T();
  }
  // else

  const auto payload = boost::any_cast<T>(&cast.m_payload);
  if (!payload)
  {
    // A (custom) parser produced a payload of the wrong shape for `target`.
    *err_code = error::Code::S_VALUE_PARSE_FAILED;
    return T();
  }
  return *payload;
} // Value::cast_and_unwrap()

std::string Value::to_string(const Data_type_registry& registry, Error_code* err_code) const
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(std::string, to_string, registry, _1);
  return cast_and_unwrap<std::string>(registry, basic_types::string(), err_code);
}

int32_t Value::to_integer(const Data_type_registry& registry, Error_code* err_code) const
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(int32_t, to_integer, registry, _1);
  return cast_and_unwrap<int32_t>(registry, basic_types::integer(), err_code);
}

int64_t Value::to_long(const Data_type_registry& registry, Error_code* err_code) const
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(int64_t, to_long, registry, _1);
  return cast_and_unwrap<int64_t>(registry, basic_types::long_(), err_code);
}

double Value::to_double(const Data_type_registry& registry, Error_code* err_code) const
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(double, to_double, registry, _1);
  return cast_and_unwrap<double>(registry, basic_types::double_(), err_code);
}

bool Value::to_boolean(const Data_type_registry& registry, Error_code* err_code) const
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(bool, to_boolean, registry, _1);
  return cast_and_unwrap<bool>(registry, basic_types::boolean(), err_code);
}

Extra_boolean Value::to_extra_boolean(const Data_type_registry& registry, Error_code* err_code) const
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Extra_boolean, to_extra_boolean, registry, _1);
  return cast_and_unwrap<Extra_boolean>(registry, basic_types::extra_boolean(), err_code);
}

boost::gregorian::date Value::to_date(const Data_type_registry& registry, Error_code* err_code) const
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(boost::gregorian::date, to_date, registry, _1);
  return cast_and_unwrap<boost::gregorian::date>(registry, basic_types::date(), err_code);
}

boost::posix_time::ptime Value::to_date_time(const Data_type_registry& registry, Error_code* err_code) const
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(boost::posix_time::ptime, to_date_time, registry, _1);
  return cast_and_unwrap<boost::posix_time::ptime>(registry, basic_types::date_time(), err_code);
}

std::string Value::rendering() const
{
  if (is_null())
  {
    return "null";
  }
  // else
  std::string result;
  if (!render_basic_payload(m_payload, &result))
  {
    result = "<custom>";
  }
  return result;
}

std::string Value::description() const
{
  return util::ostream_op_string(rendering(), " (", m_type, ')');
}

bool render_basic_payload(const boost::any& payload, std::string* result)
{
  using boost::any_cast;

  if (const auto val = any_cast<std::string>(&payload))
  {
    *result = *val;
  }
  else if (const auto val = any_cast<int32_t>(&payload))
  {
    *result = fmt::format("{}", *val);
  }
  else if (const auto val = any_cast<int64_t>(&payload))
  {
    *result = fmt::format("{}", *val);
  }
  else if (const auto val = any_cast<double>(&payload))
  {
    // fmt's default is the shortest representation that round-trips: 4.2 gives "4.2", not "4.2000000000000002".
    *result = fmt::format("{}", *val);
  }
  else if (const auto val = any_cast<bool>(&payload))
  {
    *result = *val ? "true" : "false";
  }
  else if (const auto val = any_cast<Extra_boolean>(&payload))
  {
    *result = util::ostream_op_string(*val);
  }
  else if (const auto val = any_cast<boost::gregorian::date>(&payload))
  {
    *result = boost::gregorian::to_iso_extended_string(*val);
  }
  else if (const auto val = any_cast<boost::posix_time::ptime>(&payload))
  {
    *result = boost::posix_time::to_iso_extended_string(*val);
  }
  else
  {
    return false;
  }
  return true;
} // render_basic_payload()

bool operator==(const Value& val1, const Value& val2)
{
  if (val1.type() != val2.type())
  {
    return false;
  }
  // else
  const auto& payload1 = val1.raw();
  const auto& payload2 = val2.raw();
  if (payload1.empty() || payload2.empty())
  {
    return payload1.empty() && payload2.empty();
  }
  // else

  bool equal = false;
  return (payloads_equal_as<std::string>(payload1, payload2, &equal)
          || payloads_equal_as<int32_t>(payload1, payload2, &equal)
          || payloads_equal_as<int64_t>(payload1, payload2, &equal)
          || payloads_equal_as<double>(payload1, payload2, &equal)
          || payloads_equal_as<bool>(payload1, payload2, &equal)
          || payloads_equal_as<Extra_boolean>(payload1, payload2, &equal)
          || payloads_equal_as<boost::gregorian::date>(payload1, payload2, &equal)
          || payloads_equal_as<boost::posix_time::ptime>(payload1, payload2, &equal))
         && equal;
}

bool operator!=(const Value& val1, const Value& val2)
{
  return !(val1 == val2);
}

std::ostream& operator<<(std::ostream& os, const Value& val)
{
  return os << val.description();
}

} // namespace utopia::generics
