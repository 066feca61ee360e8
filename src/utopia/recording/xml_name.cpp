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
#include "utopia/recording/xml_name.hpp"
#include <fmt/format.h>
#include <cctype>

namespace utopia::recording
{

namespace
{

/// Length of an escape: `_x` + 4 hex digits + `_`.
constexpr size_t S_ESCAPE_LENGTH = 7;

/**
 * If `name` has an escape at `pos`, sets `*code` and returns `true`.
 *
 * @param name
 *        String.
 * @param pos
 *        Position.
 * @param code
 *        Result.
 * @return See above.
 */
bool escape_at(util::String_view name, size_t pos, unsigned int* code)
{
  if ((name.size() - pos < S_ESCAPE_LENGTH) || (name[pos] != '_') || (name[pos + 1] != 'x')
      || (name[pos + S_ESCAPE_LENGTH - 1] != '_'))
  {
    return false;
  }
  // else

  unsigned int result = 0;
  for (size_t idx = pos + 2; idx != pos + 6; ++idx)
  {
    const auto ch = static_cast<unsigned char>(name[idx]);
    if (!std::isxdigit(ch))
    {
      return false;
    }
    result = (result << 4) | ((ch <= '9') ? (ch - '0') : ((std::toupper(ch) - 'A') + 10));
  }
  *code = result;
  return true;
}

/**
 * `true` if the byte may appear unescaped at the given position of a name.
 *
 * @param ch
 *        Byte.
 * @param first
 *        Whether it is the first byte.
 * @return See above.
 */
bool is_name_byte(unsigned char ch, bool first)
{
  if ((ch >= 0x80) || std::isalpha(ch) || (ch == '_'))
  {
    return true;
  }
  return (!first) && (std::isdigit(ch) || (ch == '-') || (ch == '.'));
}

/**
 * Appends the UTF-8 encoding of the code point.
 *
 * @param code
 *        Code point, at most 0xFFFF.
 * @param result
 *        Target.
 */
void append_utf8(unsigned int code, std::string* result)
{
  if (code < 0x80)
  {
    result->push_back(char(code));
  }
  else if (code < 0x800)
  {
    result->push_back(char(0xC0 | (code >> 6)));
    result->push_back(char(0x80 | (code & 0x3F)));
  }
  else
  {
    result->push_back(char(0xE0 | (code >> 12)));
    result->push_back(char(0x80 | ((code >> 6) & 0x3F)));
    result->push_back(char(0x80 | (code & 0x3F)));
  }
}

} // namespace (anon)

std::string encode_xml_name(util::String_view name)
{
  std::string result;
  result.reserve(name.size());

  for (size_t pos = 0; pos != name.size(); ++pos)
  {
    const auto ch = static_cast<unsigned char>(name[pos]);
    unsigned int ignored;
    if (is_name_byte(ch, pos == 0) && (!escape_at(name, pos, &ignored)))
    {
      result.push_back(char(ch));
    }
    else
    {
      result += fmt::format("_x{:04X}_", static_cast<unsigned int>(ch));
    }
  }
  return result;
}

std::string decode_xml_name(util::String_view name)
{
  std::string result;
  result.reserve(name.size());

  size_t pos = 0;
  while (pos != name.size())
  {
    unsigned int code;
    if (escape_at(name, pos, &code))
    {
      append_utf8(code, &result);
      pos += S_ESCAPE_LENGTH;
    }
    else
    {
      result.push_back(name[pos]);
      ++pos;
    }
  }
  return result;
}

} // namespace utopia::recording
