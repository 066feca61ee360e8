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

#include "utopia/recording/constructor.hpp"
#include "utopia/recording/line_reader.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/filesystem/fstream.hpp>

namespace utopia::recording
{

/**
 * Feeds the text format, line by line, into a Constructor.  The Constructor's options (Constructor::options())
 * determine the indicators.  Each meaningful line (see Line_reader) is one of:
 *   - `<instruction indicator><instruction>`: Constructor::set_instruction() with the (trimmed) remainder;
 *   - `<id indicator>...`: Constructor::create() with the whole line as the ID;
 *   - `<name>=<value>`: split at the first `=` (names and values are trimmed).  If the value starts with the ID
 *     indicator, it is Constructor::add_link(); otherwise Constructor::add_attribute().
 *
 * Anything else, including a line whose only `=` is its last character, is recording::error::Code::S_MALFORMED_LINE.
 *
 * @tparam Construct
 *         See Constructor.
 */
template<typename Construct>
class Text_instructor :
  public flow::log::Log_context
{
public:
  // Types.

  /// The Constructor being fed.
  using Constructor_t = Constructor<Construct>;

  // Constructors/destructor.

  /**
   * Constructs the instructor.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging; null means no logging.
   * @param constructor
   *        The Constructor to feed.  Must outlive `*this`.
   */
  explicit Text_instructor(flow::log::Logger* logger_ptr, Constructor_t* constructor);

  // Methods.

  /**
   * Interprets one line (already trimmed, non-blank, non-comment).
   *
   * @param line
   *        Line.
   * @param err_code
   *        See utopia::Error_code docs for error reporting semantics.  Generated error codes:
   *        recording::error::Code::S_MALFORMED_LINE; those of Constructor::create(), Constructor::add_attribute(),
   *        Constructor::add_link().
   */
  void consume_line(const std::string& line, Error_code* err_code = 0);

  /**
   * Reads the whole stream, stopping at the first error; then calls Constructor::finish().
   *
   * @param is
   *        Stream.
   * @param err_code
   *        See utopia::Error_code docs for error reporting semantics.  Generated error codes: those of
   *        consume_line(); those of Constructor::finish().
   */
  void construct_from(std::istream& is, Error_code* err_code = 0);

  /**
   * Same as construct_from() but from the given file.
   *
   * @param path
   *        File path.
   * @param err_code
   *        See construct_from().  In addition: recording::error::Code::S_FILE_NOT_FOUND.
   */
  void construct_from_file(const boost::filesystem::path& path, Error_code* err_code = 0);

private:
  // Data.

  /// See constructor.
  Constructor_t* const m_constructor;

  /// Splits the source into lines.
  Line_reader m_line_reader;
}; // class Text_instructor

// Template implementations.

template<typename Construct>
Text_instructor<Construct>::Text_instructor(flow::log::Logger* logger_ptr, Constructor_t* constructor) :
  flow::log::Log_context(logger_ptr, Log_component::S_RECORDING),
  m_constructor(constructor),
  m_line_reader(logger_ptr, constructor->options())
{
  // Nothing else.
}

template<typename Construct>
void Text_instructor<Construct>::consume_line(const std::string& line, Error_code* err_code)
{
  using boost::algorithm::starts_with;
  using boost::algorithm::trim_copy;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { consume_line(line, actual_err_code); },
         err_code, FLOW_UTIL_WHERE_AM_I_STR()))
  {
    return;
  }
  // else
  err_code->clear();
  const auto& opts = m_constructor->options();

  if (starts_with(line, opts.m_instruction_indicator))
  {
    m_constructor->set_instruction(trim_copy(line.substr(opts.m_instruction_indicator.size())));
    return;
  }
  // else
  if (starts_with(line, opts.m_id_indicator))
  {
    m_constructor->create(line, err_code);
    return;
  }
  // else

  const auto eq_pos = line.find('=');
  if ((eq_pos == std::string::npos) || (eq_pos == line.size() - 1))
  {
    FLOW_LOG_WARNING("Line [" << line << "] is neither an instruction, nor an ID, nor a `name=value` pair.");
    FLOW_ERROR_EMIT_ERROR(error::Code::S_MALFORMED_LINE);
    return;
  }
  // else

  const auto name = trim_copy(line.substr(0, eq_pos));
  const auto value = trim_copy(line.substr(eq_pos + 1));
  if (starts_with(value, opts.m_id_indicator))
  {
    m_constructor->add_link(name, value, err_code);
  }
  else
  {
    m_constructor->add_attribute(name, value, err_code);
  }
} // Text_instructor::consume_line()

template<typename Construct>
void Text_instructor<Construct>::construct_from(std::istream& is, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { construct_from(is, actual_err_code); },
         err_code, FLOW_UTIL_WHERE_AM_I_STR()))
  {
    return;
  }
  // else
  err_code->clear();

  const auto n_lines = m_line_reader.read(is, [this](const std::string& line, Error_code* line_err_code)
  {
    consume_line(line, line_err_code);
  }, err_code);
  if (*err_code)
  {
    return;
  }
  // else

  FLOW_LOG_INFO("Consumed [" << n_lines << "] lines; constructs now number "
                  "[" << m_constructor->constructs().size() << "].");
  m_constructor->finish(err_code);
}

template<typename Construct>
void Text_instructor<Construct>::construct_from_file(const boost::filesystem::path& path, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { construct_from_file(path, actual_err_code); },
         err_code, FLOW_UTIL_WHERE_AM_I_STR()))
  {
    return;
  }
  // else
  err_code->clear();

  boost::filesystem::ifstream is(path);
  if (!is)
  {
    FLOW_LOG_WARNING("Could not open [" << path << "] for reading.");
    FLOW_ERROR_EMIT_ERROR(error::Code::S_FILE_NOT_FOUND);
    return;
  }
  // else
  construct_from(is, err_code);
}

} // namespace utopia::recording
