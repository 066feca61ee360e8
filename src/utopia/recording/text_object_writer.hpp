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
#include <ostream>

namespace utopia::recording
{

/**
 * Writes objects in the line-oriented text format read by Text_instructor: per object, its ID line, then a
 * `name=value` line per attribute, then a `name=<linked ID>` line per link, both in ascending name order.
 *
 * Not everything fits that format, and a reader trims names and values.  write_into() refuses (writing nothing for
 * the object):
 *   - an attribute or link name that is empty; contains `=` or a line break; has leading or trailing white space; or
 *     starts with any of the indicators (a reader would take its line for something else);
 *   - an attribute value that is empty; contains a line break; has leading or trailing white space; or starts with
 *     the ID indicator (a reader would take it for a link).
 */
class Text_object_writer :
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
   *        Options; copied.  The indicators matter.
   */
  explicit Text_object_writer(flow::log::Logger* logger_ptr = 0, const Recording_options& opts = Recording_options());

  // Methods.

  /**
   * Writes the object (but not the linked objects themselves).
   *
   * @param writable
   *        Object.
   * @param os
   *        Stream.
   * @param err_code
   *        See utopia::Error_code docs for error reporting semantics.  Generated error codes:
   *        recording::error::Code::S_UNWRITABLE_TEXT.
   */
  void write_into(const Writable& writable, std::ostream& os, Error_code* err_code = 0);

  /**
   * Writes an instruction line, applying to the objects written after it.
   *
   * @param instruction
   *        Instruction; must not contain a line break.
   * @param os
   *        Stream.
   * @param err_code
   *        See utopia::Error_code docs for error reporting semantics.  Generated error codes:
   *        recording::error::Code::S_UNWRITABLE_TEXT.
   */
  void write_instruction(util::String_view instruction, std::ostream& os, Error_code* err_code = 0);
}; // class Text_object_writer

} // namespace utopia::recording
