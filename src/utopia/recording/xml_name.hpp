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

#include "utopia/recording/recording_fwd.hpp"
#include <string>

namespace utopia::recording
{

// Free functions.

/**
 * Makes an arbitrary string usable as an XML element name, reversibly (see decode_xml_name()).  Each character
 * (byte) that is not allowed at its position in an XML name is replaced by `_xHHHH_`, `HHHH` being its code as 4
 * upper-case hex digits; so is each `_` that would otherwise start something looking like such an escape.  E.g.,
 * `#abc` becomes `_x0023_abc`.
 *
 * Allowed unescaped: ASCII letters and `_` anywhere; digits, `-`, and `.` anywhere but first; bytes of multi-byte
 * UTF-8 sequences anywhere.  `:` is always escaped, as XML reserves it for namespaces.  An empty string stays empty
 * (and is not a valid name).
 *
 * @param name
 *        String to encode.
 * @return See above.
 */
std::string encode_xml_name(util::String_view name);

/**
 * Inverse of encode_xml_name(): replaces each `_xHHHH_` by the character with that code (UTF-8-encoded if above
 * 0x7F).  Anything else, including malformed escapes, is copied as-is.
 *
 * @param name
 *        Encoded name.
 * @return See above.
 */
std::string decode_xml_name(util::String_view name);

} // namespace utopia::recording
