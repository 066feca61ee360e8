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

#include "utopia/recording/options.hpp"
#include <flow/log/log.hpp>
#include <boost/filesystem/path.hpp>
#include <istream>
#include <string>

namespace utopia::recording
{

/**
 * Reads line-oriented text, handing each meaningful line to a handler.  Each line is trimmed of surrounding
 * whitespace; then blank lines and lines starting with Recording_options::m_comment_indicator are skipped.  Line
 * endings may be `\n` or `\r\n`.
 */
class Line_reader :
  public flow::log::Log_context
{
public:
  // Types.

  /**
   * Consumes one trimmed, non-blank, non-comment line.  To stop the reading, set `*err_code` to a truthy value;
   * read() then returns that error.  `err_code` is never null.
   */
  using Line_handler = Function<void (const std::string& line, Error_code* err_code)>;

  // Constructors/destructor.

  /**
   * Constructs the reader.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging; null means no logging.
   * @param opts
   *        Options; copied.
   */
  explicit Line_reader(flow::log::Logger* logger_ptr = 0, const Recording_options& opts = Recording_options());

  // Methods.

  /**
   * Reads the stream to its end (or the first handler error), calling `handler` on each meaningful line.
   *
   * @param is
   *        Stream.
   * @param handler
   *        See #Line_handler.
   * @param err_code
   *        See utopia::Error_code docs for error reporting semantics.  Generated error codes: whatever `handler`
   *        emits.
   * @return Number of lines given to `handler`, including the one that failed, if any.
   */
  size_t read(std::istream& is, const Line_handler& handler, Error_code* err_code = 0);

  /**
   * Same as read() but opens the given file first.
   *
   * @param path
   *        File path.
   * @param handler
   *        See #Line_handler.
   * @param err_code
   *        See utopia::Error_code docs for error reporting semantics.  Generated error codes:
   *        recording::error::Code::S_FILE_NOT_FOUND; whatever `handler` emits.
   * @return See read(); 0 if the file could not be opened.
   */
  size_t read_file(const boost::filesystem::path& path, const Line_handler& handler, Error_code* err_code = 0);

  /**
   * The options.
   *
   * @return See above.
   */
  const Recording_options& options() const;

private:
  // Data.

  /// See options().
  const Recording_options m_opts;
}; // class Line_reader

} // namespace utopia::recording
