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

#include "utopia/common.hpp"
#include <string>

namespace utopia::recording
{

/**
 * Receives the element-level events of an XML document from Xml_element_reader, in document order.  To abort the
 * reading, an `on_...()` method sets `*err_code` to a truthy value; the reader stops and reports that error.
 * `err_code` is never null.
 */
class Xml_element_handler
{
public:
  /// Boring virtual destructor.
  virtual ~Xml_element_handler();

  /**
   * An element starts.
   *
   * @param name
   *        Element name, already decoded (decode_xml_name()).
   * @param depth
   *        0 for the root element, 1 for its children, etc.
   * @param err_code
   *        See above.
   */
  virtual void on_start_element(const std::string& name, unsigned int depth, Error_code* err_code) = 0;

  /**
   * Character data inside the innermost open element.  CDATA sections are always reported (even if empty); plain
   * text only if it is not all whitespace.
   *
   * @param text
   *        The text, with entities resolved.
   * @param err_code
   *        See above.
   */
  virtual void on_characters(const std::string& text, Error_code* err_code) = 0;

  /**
   * An element ends.
   *
   * @param name
   *        See on_start_element().
   * @param depth
   *        See on_start_element().
   * @param err_code
   *        See above.
   */
  virtual void on_end_element(const std::string& name, unsigned int depth, Error_code* err_code) = 0;
}; // class Xml_element_handler

} // namespace utopia::recording
