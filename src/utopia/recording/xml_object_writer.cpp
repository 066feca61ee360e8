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
#include "utopia/recording/xml_object_writer.hpp"
#include "utopia/recording/xml_name.hpp"
#include "utopia/recording/error/error.hpp"
#include <flow/error/error.hpp>
#include <boost/algorithm/string/predicate.hpp>

namespace utopia::recording
{

Xml_object_writer::Xml_object_writer(flow::log::Logger* logger_ptr, const Recording_options& opts) :
  Object_writer(logger_ptr, opts),
  m_document_open(false),
  m_instruction_open(false)
{
  // Nothing else.
}

void Xml_object_writer::open_document(util::String_view root_name, tinyxml2::XMLPrinter* printer,
                                      Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { open_document(root_name, printer, actual_err_code); },
         err_code, FLOW_UTIL_WHERE_AM_I_STR()))
  {
    return;
  }
  // else
  err_code->clear();

  if (m_document_open)
  {
    FLOW_LOG_WARNING("Cannot open XML document with root [" << root_name << "]: one is already open.");
    FLOW_ERROR_EMIT_ERROR(error::Code::S_XML_DOCUMENT_ALREADY_OPEN);
    return;
  }
  // else

  printer->PushHeader(false, true);
  open_element(root_name, printer);
  m_document_open = true;
}

void Xml_object_writer::open_instruction(util::String_view instruction, tinyxml2::XMLPrinter* printer)
{
  if (!m_document_open)
  {
    open_document(options().m_xml_root_name, printer);
  }
  close_instruction(printer);

  open_element(instruction, printer);
  m_instruction_open = true;
}

void Xml_object_writer::close_instruction(tinyxml2::XMLPrinter* printer)
{
  if (m_instruction_open)
  {
    printer->CloseElement();
    m_instruction_open = false;
  }
}

void Xml_object_writer::write_into(const Writable& writable, tinyxml2::XMLPrinter* printer, Error_code* err_code)
{
  using boost::algorithm::starts_with;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { write_into(writable, printer, actual_err_code); },
         err_code, FLOW_UTIL_WHERE_AM_I_STR()))
  {
    return;
  }
  // else
  err_code->clear();

  /* A reader takes an element whose name starts with the ID indicator for a new object, and character data starting
   * with it for a link.  An empty name makes no element at all. */
  const auto& id_indicator = options().m_id_indicator;
  const auto is_writable_name = [&](const std::string& name) -> bool
  {
    return !(name.empty() || ((!id_indicator.empty()) && starts_with(name, id_indicator)));
  };

  const auto attributes = writable.attributes();
  for (const auto& name_and_value : attributes)
  {
    const auto& name = name_and_value.first;
    const auto& value = name_and_value.second;
    if ((!is_writable_name(name)) || ((!id_indicator.empty()) && starts_with(value, id_indicator)))
    {
      FLOW_LOG_WARNING("Cannot write attribute [" << name << "] = [" << value << "] as an XML element; "
                         "writing nothing for this object.");
      FLOW_ERROR_EMIT_ERROR(error::Code::S_UNWRITABLE_TEXT);
      return;
    }
  }
  const auto links = writable.links();
  for (const auto& name_and_target : links)
  {
    if (!is_writable_name(name_and_target.first))
    {
      FLOW_LOG_WARNING("Cannot write link [" << name_and_target.first << "] as an XML element; "
                         "writing nothing for this object.");
      FLOW_ERROR_EMIT_ERROR(error::Code::S_UNWRITABLE_TEXT);
      return;
    }
  }

  if (!m_document_open)
  {
    open_document(options().m_xml_root_name, printer);
  }

  open_element(id_for(writable), printer);
  for (const auto& name_and_value : attributes)
  {
    open_element(name_and_value.first, printer);
    // CDATA cannot hold its own terminator; fall back to escaped text then.
    const auto& value = name_and_value.second;
    printer->PushText(value.c_str(), value.find("]]>") == std::string::npos);
    printer->CloseElement(true);
  }
  for (const auto& name_and_target : links)
  {
    if (name_and_target.second)
    {
      open_element(name_and_target.first, printer);
      printer->PushText(id_for(*name_and_target.second).c_str(), true);
      printer->CloseElement(true);
    }
  }
  printer->CloseElement();
} // Xml_object_writer::write_into()

void Xml_object_writer::close_document(tinyxml2::XMLPrinter* printer)
{
  close_instruction(printer);
  if (m_document_open)
  {
    printer->CloseElement();
    m_document_open = false;
  }
}

bool Xml_object_writer::document_open() const
{
  return m_document_open;
}

void Xml_object_writer::open_element(util::String_view name, tinyxml2::XMLPrinter* printer) // Static.
{
  printer->OpenElement(encode_xml_name(name).c_str());
}

} // namespace utopia::recording
