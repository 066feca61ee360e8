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

#include "utopia/util/util_fwd.hpp"
#include "utopia/common.hpp"
#include <iosfwd>

/**
 * Utopia module for recording graphs of interlinked objects in a flat, replayable form, and for replaying them.
 *
 * The idea: an object graph is written as a stream of three kinds of instruction -- "create the object with this
 * ID", "set this attribute on the latest object", "link the latest object's attribute to the object with that ID"
 * -- possibly grouped under an ambient *instruction* string.  Replaying the stream rebuilds the graph, resolving
 * links to objects that do not exist yet once they are created (forward references).  Cycles thus pose no problem.
 *
 * The pieces:
 *   - recording::Constructor: the graph builder.  A class template over the object type, which need only offer
 *     `set_id()`, `set_attribute()`, and `set_link()`; no base class is required.
 *   - Writing: recording::Writable is the interface an object offers to be written;
 *     recording::Text_object_writer and recording::Xml_object_writer write it (with stable generated IDs, per
 *     recording::Object_writer).
 *   - Reading: recording::Line_reader and recording::Xml_element_reader tokenize a source;
 *     recording::Text_instructor and recording::Xml_instructor feed the tokens to a Constructor.
 *   - recording::Recording_options: the indicators and switches shared by the above.
 *
 * Text format, one instruction per line:
 *
 *   ~~~
 *   // Comment.
 *   %CHECK:some instruction
 *   #k2j9x
 *   name=Alice
 *   friend=#a81bq
 *   ~~~
 *
 * XML format: under the root element, an optional instruction element wraps object elements; an object element is
 * named after its ID; each of its children is named after an attribute and holds the value (or linked ID) as
 * CDATA.  Element names go through encode_xml_name().
 */
namespace utopia::recording
{

// Types.

// Find doc headers near the bodies of these compound types.

template<typename Construct>
class Constructor;
template<typename Construct>
class Text_instructor;
template<typename Construct>
class Xml_instructor;

class Line_reader;
class Object_writer;
class Text_object_writer;
class Writable;
class Xml_element_handler;
class Xml_element_reader;
class Xml_object_writer;

struct Recording_options;

// Free functions.

/**
 * Prints the option values, as in a config file.
 *
 * @param os
 *        Stream to which to write.
 * @param opts
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Recording_options& opts);

} // namespace utopia::recording
