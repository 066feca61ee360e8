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

#include "utopia/recording/xml_element_handler.hpp"
#include "utopia/util/util_fwd.hpp"
#include <flow/log/log.hpp>
#include <boost/filesystem/path.hpp>
#include <istream>

namespace utopia::recording
{

/**
 * Parses a UTF-8 XML document (with tinyxml2) and walks it, reporting its elements and character data to an
 * Xml_element_handler.  The whole document is parsed before the first event, so a malformed document yields no
 * events at all.
 */
class Xml_element_reader :
  public flow::log::Log_context
{
public:
  // Constructors/destructor.

  /**
   * Constructs the reader.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging; null means no logging.
   */
  explicit Xml_element_reader(flow::log::Logger* logger_ptr = 0);

  // Methods.

  /**
   * Parses the given document text and reports it to `handler`.
   *
   * @param xml
   *        The document.
   * @param handler
   *        Handler.
   * @param err_code
   *        See utopia::Error_code docs for error reporting semantics.  Generated error codes:
   *        recording::error::Code::S_MALFORMED_XML; whatever `handler` emits.
   */
  void read_string(util::String_view xml, Xml_element_handler* handler, Error_code* err_code = 0);

  /**
   * Same as read_string() but reads the document from the stream (to its end) first.
   *
   * @param is
   *        Stream.
   * @param handler
   *        Handler.
   * @param err_code
   *        See read_string().
   */
  void read(std::istream& is, Xml_element_handler* handler, Error_code* err_code = 0);

  /**
   * Same as read_string() but reads the document from the given file first.
   *
   * @param path
   *        File path.
   * @param handler
   *        Handler.
   * @param err_code
   *        See read_string().  In addition: recording::error::Code::S_FILE_NOT_FOUND.
   */
  void read_file(const boost::filesystem::path& path, Xml_element_handler* handler, Error_code* err_code = 0);
}; // class Xml_element_reader

} // namespace utopia::recording
