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
#include "utopia/recording/text_object_writer.hpp"
#include "utopia/recording/error/error.hpp"
#include <flow/error/error.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>

namespace utopia::recording
{

namespace
{

/**
 * `true` if the string has a line break.
 *
 * @param str
 *        String.
 * @return See above.
 */
bool has_line_break(util::String_view str)
{
  return str.find_first_of("\r\n") != util::String_view::npos;
}

/**
 * `true` if the string has white space a reader would trim away.
 *
 * @param str
 *        String.
 * @return See above.
 */
bool is_padded(const std::string& str)
{
  return str != boost::algorithm::trim_copy(str);
}

/**
 * `true` if the string starts with the given indicator; an empty indicator matches nothing.
 *
 * @param str
 *        String.
 * @param indicator
 *        Indicator.
 * @return See above.
 */
bool starts_with_indicator(const std::string& str, const std::string& indicator)
{
  return (!indicator.empty()) && boost::algorithm::starts_with(str, indicator);
}

} // namespace (anon)

Text_object_writer::Text_object_writer(flow::log::Logger* logger_ptr, const Recording_options& opts) :
  Object_writer(logger_ptr, opts)
{
  // Nothing else.
}

void Text_object_writer::write_into(const Writable& writable, std::ostream& os, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { write_into(writable, os, actual_err_code); },
         err_code, FLOW_UTIL_WHERE_AM_I_STR()))
  {
    return;
  }
  // else
  err_code->clear();

  /* A name must not look like an ID, instruction, or comment line, or a reader would take its line for one.
   * A value starting with the ID indicator would read back as a link. */
  const auto& opts = options();
  const auto is_writable_name = [&](const std::string& name) -> bool
  {
    return !(name.empty() || (name.find('=') != std::string::npos) || has_line_break(name) || is_padded(name)
             || starts_with_indicator(name, opts.m_id_indicator)
             || starts_with_indicator(name, opts.m_instruction_indicator)
             || starts_with_indicator(name, opts.m_comment_indicator));
  };

  const auto attributes = writable.attributes();
  for (const auto& name_and_value : attributes)
  {
    const auto& name = name_and_value.first;
    const auto& value = name_and_value.second;
    if ((!is_writable_name(name))
        || value.empty() || has_line_break(value) || is_padded(value)
        || starts_with_indicator(value, opts.m_id_indicator))
    {
      FLOW_LOG_WARNING("Cannot write attribute [" << name << "] = [" << value << "] as a line of text; "
                         "writing nothing for this object.");
      FLOW_ERROR_EMIT_ERROR(error::Code::S_UNWRITABLE_TEXT);
      return;
    }
  }
  // Links are checked the same way, but only their names can be bad.
  const auto links = writable.links();
  for (const auto& name_and_target : links)
  {
    const auto& name = name_and_target.first;
    if (!is_writable_name(name))
    {
      FLOW_LOG_WARNING("Cannot write link [" << name << "] as a line of text; writing nothing for this object.");
      FLOW_ERROR_EMIT_ERROR(error::Code::S_UNWRITABLE_TEXT);
      return;
    }
  }

  os << id_for(writable) << '\n';
  for (const auto& name_and_value : attributes)
  {
    os << name_and_value.first << '=' << name_and_value.second << '\n';
  }
  for (const auto& name_and_target : links)
  {
    if (name_and_target.second)
    {
      os << name_and_target.first << '=' << id_for(*name_and_target.second) << '\n';
    }
  }
} // Text_object_writer::write_into()

void Text_object_writer::write_instruction(util::String_view instruction, std::ostream& os, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { write_instruction(instruction, os, actual_err_code); },
         err_code, FLOW_UTIL_WHERE_AM_I_STR()))
  {
    return;
  }
  // else
  err_code->clear();

  if (has_line_break(instruction))
  {
    FLOW_LOG_WARNING("Cannot write instruction [" << instruction << "] as a line of text.");
    FLOW_ERROR_EMIT_ERROR(error::Code::S_UNWRITABLE_TEXT);
    return;
  }
  // else
  os << options().m_instruction_indicator << instruction << '\n';
}

} // namespace utopia::recording
