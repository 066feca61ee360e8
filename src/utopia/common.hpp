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

#include "utopia/detail/common.hpp"
#include <flow/common.hpp>

/**
 * @mainpage
 *
 * Welcome to Utopia.  Utopia is a library made of two cooperating halves.
 *
 *   - utopia::generics: a dynamic value system.  A utopia::generics::Value is an immutable (payload, data type) pair;
 *     data types form a forest ("INTEGER is a NUMBER"); an explicitly constructed
 *     utopia::generics::Data_type_registry owns that forest plus an ordered chain of value parsers, which
 *     convert values between types and report how reliable a hypothetical conversion would be.
 *   - utopia::recording: an object-graph recording protocol.  utopia::recording::Constructor consumes a flat stream
 *     of create / set-attribute / set-link instructions -- produced by text or XML readers -- and builds a graph of
 *     interlinked objects, resolving links to objects that do not exist yet (forward references).  The writers
 *     (utopia::recording::Text_object_writer, utopia::recording::Xml_object_writer) do the reverse.
 *
 * Utopia is built on Flow: logging is flow::log, errors follow flow::error conventions, and utopia::util
 * adds utopia::util::Id_generator to what flow::util already provides.
 *
 * ### Error reporting convention ###
 * Nearly every fallible API takes a trailing `Error_code* err_code = 0`.  If `err_code` is not null, then on return
 * `*err_code` is falsy on success, truthy on failure (and the return value, if any, is meaningless).  If `err_code`
 * is null, failure results in flow::error::Runtime_error being thrown, carrying the same #Error_code plus some
 * context.  See flow::error for details.
 *
 * ### Thread safety ###
 * Unless stated otherwise, an object of any class in this library is not safe for concurrent access by multiple
 * threads, if at least one of those accesses is non-`const`.  Loggers are the exception; they lock internally.
 */
namespace utopia
{

// Types.  They're outside of `namespace ::utopia::util` for brevity due to their frequent use.

/// Short-hand for flow::Error_code, the boost.system error code through which all Utopia modules report errors.
using Error_code = flow::Error_code;

/// Short-hand for flow::Function, the polymorphic function wrapper used throughout.
template<typename Signature>
using Function = flow::Function<Signature>;

#ifdef UTOPIA_DOXYGEN_ONLY // Actual compilation will ignore the below; but Doxygen will scan it and generate docs.

/**
 * The flow::log::Component payload enumeration comprising the log components used by Utopia's own
 * logging.  Utopia code specifies members thereof when indicating the log component for each particular
 * piece of logging code.  User code can use it to configure per-component verbosity
 * (via flow::log::Config::configure_component_verbosity()).
 *
 * @internal
 * The members are generated by flow::log macro magic from
 * `utopia/detail/macros/log_component_enum_declare.macros.hpp`.
 */
enum class Log_component
{
  /// Sentinel; appended automatically after the members listed in the macro file.
  S_END_SENTINEL
};

/**
 * The map generated by flow::log macro magic that maps each enumerated value in utopia::Log_component to its
 * string representation as used in log output and verbosity config.  Pass it to
 * flow::log::Config::init_component_names() when setting up a flow::log::Config.
 */
extern const boost::unordered_multimap<Log_component, std::string> S_UTOPIA_LOG_COMPONENT_NAME_MAP;

#endif // UTOPIA_DOXYGEN_ONLY

} // namespace utopia
