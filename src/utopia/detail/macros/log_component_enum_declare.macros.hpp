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

/// @cond
// -^- Doxygen, please ignore the following.  This is wacky macro magic and not a regular `#pragma once` header.

/* See common.hpp and common.cpp which #include us.
 * Long story short, the following macro invocations directly or indirectly specify:
 *   - each enum variable name of `enum class utopia::Log_component`, the flow::log Component payload enum used by
 *     Utopia log messages (`S_` is auto-prepended to each name);
 *   - for each enum variable name, its numeric counterpart;
 *   - for each enum variable name, its string version for output and config-specification purposes (the name is
 *     auto-derived from variable name via the # macro operator).
 *
 * Requirements:
 *   - The numeric values must appear in ascending order (even though gaps are allowed).
 *   - `S_END_SENTINEL` will be auto-appended, and its numeric value will equal that of the last (and highest)
 *     numeric value you specify, plus 1.  So do not declare one named `END_SENTINEL`. */

// Rarely used component corresponding to log call sites outside namespace `utopia::X`, for all X in `utopia`.
FLOW_LOG_CFG_COMPONENT_DEFINE(UNCAT, 0)
// Logging from namespace utopia::util.
FLOW_LOG_CFG_COMPONENT_DEFINE(UTIL, 1)
// Logging from namespace utopia::generics: data types, the registry, parsers, values.
FLOW_LOG_CFG_COMPONENT_DEFINE(GENERICS, 2)
// Logging from namespace utopia::recording: the graph constructor, instructors, readers, object writers.
FLOW_LOG_CFG_COMPONENT_DEFINE(RECORDING, 3)

// -v- Doxygen, please stop ignoring.
/// @endcond
