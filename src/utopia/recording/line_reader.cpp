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
#include "utopia/recording/line_reader.hpp"
#include "utopia/recording/error/error.hpp"
#include <flow/error/error.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/predicate.hpp>

namespace utopia::recording
{

Line_reader::Line_reader(flow::log::Logger* logger_ptr, const Recording_options& opts) :
  flow::log::Log_context(logger_ptr, Log_component::S_RECORDING),
  m_opts(opts)
{
  // Nothing else.
}

size_t Line_reader::read(std::istream& is, const Line_handler& handler, Error_code* err_code)
{
  using boost::algorithm::trim;
  using boost::algorithm::starts_with;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(size_t, read, is, handler, _1);
  // We are in non-null err_code mode.

  err_code->clear();

  size_t n_handled = 0;
  size_t line_num = 0;
  std::string line;
  while (std::getline(is, line))
  {
    ++line_num;
    trim(line); // Takes care of any '\r' too.
    if (line.empty()
        || ((!m_opts.m_comment_indicator.empty()) && starts_with(line, m_opts.m_comment_indicator)))
    {
      continue;
    }
    // else

    FLOW_LOG_TRACE("Line [" << line_num << "]: [" << line << "].");
    ++n_handled;
    handler(line, err_code);
    if (*err_code)
    {
      FLOW_LOG_WARNING("Handler failed on line [" << line_num << "] ([" << line << "]); stopping.  "
                         "Error: [" << *err_code << "] [" << err_code->message() << "].");
      return n_handled;
    }
  }

  FLOW_LOG_TRACE("Read [" << line_num << "] lines; handled [" << n_handled << "].");
  return n_handled;
} // Line_reader::read()

size_t Line_reader::read_file(const boost::filesystem::path& path, const Line_handler& handler, Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(size_t, read_file, path, handler, _1);
  err_code->clear();

  boost::filesystem::ifstream is(path);
  if (!is)
  {
    FLOW_LOG_WARNING("Could not open [" << path << "] for reading.");
    FLOW_ERROR_EMIT_ERROR(error::Code::S_FILE_NOT_FOUND);
    return 0;
  }
  // else

  FLOW_LOG_INFO("Reading lines from [" << path << "].");
  return read(is, handler, err_code);
}

const Recording_options& Line_reader::options() const
{
  return m_opts;
}

} // namespace utopia::recording
