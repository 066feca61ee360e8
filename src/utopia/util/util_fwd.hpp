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
#include <flow/util/util_fwd.hpp>

/**
 * Utopia's general-purpose utilities.  Most of what the rest of Utopia needs here comes from flow::util; the
 * using-declarations below bring those names in so that `util::X` reads the same everywhere in `utopia`.
 */
namespace utopia::util
{

// Types.

// Find doc headers near the bodies of these compound types.

class Id_generator;

using flow::util::String_view;

// Free functions.

using flow::util::key_exists;
using flow::util::ostream_op_string;
using flow::util::istream_to_enum;

} // namespace utopia::util
