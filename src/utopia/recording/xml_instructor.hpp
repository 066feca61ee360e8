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
#include "utopia/recording/xml_element_reader.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/optional.hpp>

namespace utopia::recording
{

/**
 * Feeds the XML format (see Xml_object_writer) into a Constructor, acting as the Xml_element_handler of an
 * Xml_element_reader.  Element names arrive decoded.  With `#` as the ID indicator:
 *   - an element whose name starts with the ID indicator, at any depth, is Constructor::create();
 *   - any other element at depth 1 (a child of the root) is Constructor::set_instruction() with its name;
 *   - any other element at depth 2 or more opens an attribute element named after it, until that element ends;
 *   - character data inside an attribute element is Constructor::add_link() if it starts with the ID indicator,
 *     else Constructor::add_attribute().
 *
 * Character data outside an attribute element is recording::error::Code::S_MALFORMED_XML_STRUCTURE.  The root
 * element's name is ignored.
 *
 * @tparam Construct
 *         See Constructor.
 */
template<typename Construct>
class Xml_instructor :
  public Xml_element_handler,
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
  explicit Xml_instructor(flow::log::Logger* logger_ptr, Constructor_t* constructor);

  // Methods.

  /**
   * Parses the whole document and feeds it in, stopping at the first error; then calls Constructor::finish().
   *
   * @param xml
   *        Document.
   * @param err_code
   *        See utopia::Error_code docs for error reporting semantics.  Generated error codes:
   *        recording::error::Code::S_MALFORMED_XML, recording::error::Code::S_MALFORMED_XML_STRUCTURE; those of
   *        Constructor::create(), Constructor::add_attribute(), Constructor::add_link(), Constructor::finish().
   */
  void construct_from_string(util::String_view xml, Error_code* err_code = 0);

  /**
   * Same as construct_from_string() but from the stream.
   *
   * @param is
   *        Stream.
   * @param err_code
   *        See construct_from_string().
   */
  void construct_from(std::istream& is, Error_code* err_code = 0);

  /**
   * Same as construct_from_string() but from the given file.
   *
   * @param path
   *        File path.
   * @param err_code
   *        See construct_from_string().  In addition: recording::error::Code::S_FILE_NOT_FOUND.
   */
  void construct_from_file(const boost::filesystem::path& path, Error_code* err_code = 0);

  /**
   * See Xml_element_handler.
   *
   * @param name
   *        See Xml_element_handler.
   * @param depth
   *        See Xml_element_handler.
   * @param err_code
   *        See Xml_element_handler.
   */
  void on_start_element(const std::string& name, unsigned int depth, Error_code* err_code) override;

  /**
   * See Xml_element_handler.
   *
   * @param text
   *        See Xml_element_handler.
   * @param err_code
   *        See Xml_element_handler.
   */
  void on_characters(const std::string& text, Error_code* err_code) override;

  /**
   * See Xml_element_handler.
   *
   * @param name
   *        See Xml_element_handler.
   * @param depth
   *        See Xml_element_handler.
   * @param err_code
   *        See Xml_element_handler.
   */
  void on_end_element(const std::string& name, unsigned int depth, Error_code* err_code) override;

private:
  // Methods.

  /**
   * Calls Constructor::finish() unless `*err_code` is already truthy.
   *
   * @param err_code
   *        Non-null.
   */
  void finish_unless_failed(Error_code* err_code);

  // Data.

  /// See constructor.
  Constructor_t* const m_constructor;

  /// Parses the documents.
  Xml_element_reader m_reader;

  /// Name of the open attribute element, if any.
  boost::optional<std::string> m_attribute_name;
}; // class Xml_instructor

// Template implementations.

template<typename Construct>
Xml_instructor<Construct>::Xml_instructor(flow::log::Logger* logger_ptr, Constructor_t* constructor) :
  flow::log::Log_context(logger_ptr, Log_component::S_RECORDING),
  m_constructor(constructor),
  m_reader(logger_ptr)
{
  // Nothing else.
}

template<typename Construct>
void Xml_instructor<Construct>::construct_from_string(util::String_view xml, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { construct_from_string(xml, actual_err_code); },
         err_code, FLOW_UTIL_WHERE_AM_I_STR()))
  {
    return;
  }
  // else
  err_code->clear();

  m_attribute_name = boost::none;
  m_reader.read_string(xml, this, err_code);
  finish_unless_failed(err_code);
}

template<typename Construct>
void Xml_instructor<Construct>::construct_from(std::istream& is, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { construct_from(is, actual_err_code); },
         err_code, FLOW_UTIL_WHERE_AM_I_STR()))
  {
    return;
  }
  // else
  err_code->clear();

  m_attribute_name = boost::none;
  m_reader.read(is, this, err_code);
  finish_unless_failed(err_code);
}

template<typename Construct>
void Xml_instructor<Construct>::construct_from_file(const boost::filesystem::path& path, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { construct_from_file(path, actual_err_code); },
         err_code, FLOW_UTIL_WHERE_AM_I_STR()))
  {
    return;
  }
  // else
  err_code->clear();

  m_attribute_name = boost::none;
  m_reader.read_file(path, this, err_code);
  finish_unless_failed(err_code);
}

template<typename Construct>
void Xml_instructor<Construct>::on_start_element(const std::string& name, unsigned int depth, Error_code* err_code)
{
  if (boost::algorithm::starts_with(name, m_constructor->options().m_id_indicator))
  {
    m_constructor->create(name, err_code);
  }
  else if (depth == 1)
  {
    m_constructor->set_instruction(name);
  }
  else if (depth >= 2)
  {
    m_attribute_name = name;
  }
  // else { Root: nothing to do. }
}

template<typename Construct>
void Xml_instructor<Construct>::on_characters(const std::string& text, Error_code* err_code)
{
  if (!m_attribute_name)
  {
    FLOW_LOG_WARNING("Character data [" << text << "] outside of any attribute element.");
    FLOW_ERROR_EMIT_ERROR(error::Code::S_MALFORMED_XML_STRUCTURE);
    return;
  }
  // else

  if (boost::algorithm::starts_with(text, m_constructor->options().m_id_indicator))
  {
    m_constructor->add_link(*m_attribute_name, text, err_code);
  }
  else
  {
    m_constructor->add_attribute(*m_attribute_name, text, err_code);
  }
}

template<typename Construct>
void Xml_instructor<Construct>::on_end_element(const std::string&, unsigned int, Error_code*)
{
  m_attribute_name = boost::none;
}

template<typename Construct>
void Xml_instructor<Construct>::finish_unless_failed(Error_code* err_code)
{
  if (!*err_code)
  {
    FLOW_LOG_INFO("Consumed XML document; constructs now number [" << m_constructor->constructs().size() << "].");
    m_constructor->finish(err_code);
  }
}

} // namespace utopia::recording
