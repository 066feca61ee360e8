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

#include "utopia/recording/object_writer.hpp"
#include <tinyxml2.h>

namespace utopia::recording
{

/**
 * Writes objects in the XML format read by Xml_instructor, into a `tinyxml2::XMLPrinter` owned by the caller:
 *
 *   ~~~
 *   <?xml version="1.0" encoding="UTF-8"?>
 *   <root>
 *     <some_instruction>
 *       <_x0023_k2j9x>
 *         <name><![CDATA[Alice]]></name>
 *         <friend><![CDATA[#a81bq]]></friend>
 *       </_x0023_k2j9x>
 *     </some_instruction>
 *   </root>
 *   ~~~
 *
 * Each object is an element named after its ID, with a child per attribute (CDATA: the value) and then per link
 * (CDATA: the linked object's ID), both in ascending name order.  All element names go through encode_xml_name().
 *
 * The writer tracks the open document and instruction elements, so calls must go to the same printer from
 * open_document() through close_document().  write_into() opens a document itself (root element named per
 * Recording_options::m_xml_root_name) if none is open.
 */
class Xml_object_writer :
  public Object_writer
{
public:
  // Constructors/destructor.

  /**
   * Constructs the writer.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging; null means no logging.
   * @param opts
   *        Options; copied.
   */
  explicit Xml_object_writer(flow::log::Logger* logger_ptr = 0, const Recording_options& opts = Recording_options());

  // Methods.

  /**
   * Writes the XML declaration and opens the root element.
   *
   * @param root_name
   *        Root element name (before encoding).
   * @param printer
   *        Printer.
   * @param err_code
   *        See utopia::Error_code docs for error reporting semantics.  Generated error codes:
   *        recording::error::Code::S_XML_DOCUMENT_ALREADY_OPEN.
   */
  void open_document(util::String_view root_name, tinyxml2::XMLPrinter* printer, Error_code* err_code = 0);

  /**
   * Opens an instruction element wrapping the objects written until close_instruction().  Closes the open one, if
   * any, first.  Opens a document if none is open.
   *
   * @param instruction
   *        Instruction (before encoding); must not be empty.
   * @param printer
   *        Printer.
   */
  void open_instruction(util::String_view instruction, tinyxml2::XMLPrinter* printer);

  /**
   * Closes the open instruction element, if any.
   *
   * @param printer
   *        Printer.
   */
  void close_instruction(tinyxml2::XMLPrinter* printer);

  /**
   * Writes the object (but not the linked objects themselves).  Refuses, writing nothing for the object, an attribute
   * or link name that is empty or starts with the ID indicator, and an attribute value that starts with the ID
   * indicator: a reader would not read either back as written.
   *
   * @param writable
   *        Object.
   * @param printer
   *        Printer.
   * @param err_code
   *        See utopia::Error_code docs for error reporting semantics.  Generated error codes:
   *        recording::error::Code::S_UNWRITABLE_TEXT.
   */
  void write_into(const Writable& writable, tinyxml2::XMLPrinter* printer, Error_code* err_code = 0);

  /**
   * Closes the open instruction element, if any, and the root element, if a document is open.
   *
   * @param printer
   *        Printer.
   */
  void close_document(tinyxml2::XMLPrinter* printer);

  /**
   * Whether a document is open.
   *
   * @return See above.
   */
  bool document_open() const;

private:
  // Methods.

  /**
   * Opens the element with the encoded name.
   *
   * @param name
   *        Name (before encoding).
   * @param printer
   *        Printer.
   */
  static void open_element(util::String_view name, tinyxml2::XMLPrinter* printer);

  // Data.

  /// See document_open().
  bool m_document_open;

  /// Whether an instruction element is open.
  bool m_instruction_open;
}; // class Xml_object_writer

} // namespace utopia::recording
