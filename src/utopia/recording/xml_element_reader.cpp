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
#include "utopia/recording/xml_element_reader.hpp"
#include "utopia/recording/xml_name.hpp"
#include "utopia/recording/error/error.hpp"
#include <flow/error/error.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <tinyxml2.h>
#include <iterator>

namespace utopia::recording
{

// Xml_element_handler implementations.

Xml_element_handler::~Xml_element_handler() = default;

namespace
{

/// Walks a parsed document, translating tinyxml2's visits into Xml_element_handler events.
class Handler_visitor :
  public tinyxml2::XMLVisitor
{
public:
  /**
   * Constructs the visitor.
   *
   * @param handler
   *        Handler.
   * @param err_code
   *        Non-null; set to the first handler error, at which point the walk stops.
   */
  explicit Handler_visitor(Xml_element_handler* handler, Error_code* err_code) :
    m_handler(handler),
    m_err_code(err_code),
    m_depth(0)
  {
    // Nothing else.
  }

  bool VisitEnter(const tinyxml2::XMLElement& element, const tinyxml2::XMLAttribute*) override
  {
    ++m_depth;
    if (*m_err_code)
    {
      return false;
    }
    // else
    m_handler->on_start_element(decode_xml_name(element.Name()), m_depth - 1, m_err_code);
    return !*m_err_code;
  }

  // tinyxml2 calls this for every entered element even once the walk is stopping; stay quiet then.
  bool VisitExit(const tinyxml2::XMLElement& element) override
  {
    --m_depth;
    if (*m_err_code)
    {
      return false;
    }
    // else
    m_handler->on_end_element(decode_xml_name(element.Name()), m_depth, m_err_code);
    return !*m_err_code;
  }

  bool Visit(const tinyxml2::XMLText& text) override
  {
    if (*m_err_code)
    {
      return false;
    }
    // else

    const std::string value(text.Value());
    if ((!text.CData()) && boost::algorithm::all(value, boost::algorithm::is_space()))
    {
      return true;
    }
    // else
    m_handler->on_characters(value, m_err_code);
    return !*m_err_code;
  }

private:
  /// See constructor.
  Xml_element_handler* const m_handler;
  /// See constructor.
  Error_code* const m_err_code;
  /// Depth of the next element to start.
  unsigned int m_depth;
}; // class Handler_visitor

} // namespace (anon)

// Xml_element_reader implementations.

Xml_element_reader::Xml_element_reader(flow::log::Logger* logger_ptr) :
  flow::log::Log_context(logger_ptr, Log_component::S_RECORDING)
{
  // Nothing else.
}

void Xml_element_reader::read_string(util::String_view xml, Xml_element_handler* handler, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { read_string(xml, handler, actual_err_code); },
         err_code, FLOW_UTIL_WHERE_AM_I_STR()))
  {
    return;
  }
  // else
  err_code->clear();

  tinyxml2::XMLDocument doc;
  if (doc.Parse(xml.data(), xml.size()) != tinyxml2::XML_SUCCESS)
  {
    FLOW_LOG_WARNING("XML document of [" << xml.size() << "] bytes is malformed: [" << doc.ErrorStr() << "].");
    FLOW_ERROR_EMIT_ERROR(error::Code::S_MALFORMED_XML);
    return;
  }
  // else
  if (!doc.RootElement())
  {
    FLOW_LOG_WARNING("XML document of [" << xml.size() << "] bytes has no root element.");
    FLOW_ERROR_EMIT_ERROR(error::Code::S_MALFORMED_XML);
    return;
  }
  // else

  Handler_visitor visitor(handler, err_code);
  doc.Accept(&visitor);
  if (*err_code)
  {
    FLOW_LOG_WARNING("XML handler stopped the walk.");
    FLOW_ERROR_LOG_ERROR(*err_code);
  }
} // Xml_element_reader::read_string()

void Xml_element_reader::read(std::istream& is, Xml_element_handler* handler, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { read(is, handler, actual_err_code); },
         err_code, FLOW_UTIL_WHERE_AM_I_STR()))
  {
    return;
  }
  // else
  err_code->clear();

  const std::string xml((std::istreambuf_iterator<char>(is)), std::istreambuf_iterator<char>());
  read_string(xml, handler, err_code);
}

void Xml_element_reader::read_file(const boost::filesystem::path& path, Xml_element_handler* handler,
                                   Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { read_file(path, handler, actual_err_code); },
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

  FLOW_LOG_INFO("Reading XML from [" << path << "].");
  read(is, handler, err_code);
}

} // namespace utopia::recording
