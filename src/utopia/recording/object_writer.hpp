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

#include "utopia/recording/options.hpp"
#include "utopia/recording/writable.hpp"
#include "utopia/util/id_generator.hpp"
#include <flow/log/log.hpp>
#include <boost/noncopyable.hpp>
#include <boost/unordered_map.hpp>

namespace utopia::recording
{

/**
 * Base of the object writers: assigns each Writable (by address) an ID from its own util::Id_generator and remembers
 * it, so that every mention of an object -- its own ID line as well as links to it from other objects -- uses the
 * same ID for as long as the writer lives (or until clear_ids()).  Subclasses supply the format.
 *
 * ### Thread safety ###
 * Not safe for concurrent non-`const` access.
 */
class Object_writer :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Methods.

  /**
   * The ID of the given object: generated on first request, the same one afterwards.
   *
   * @param writable
   *        Object.
   * @return See above.
   */
  const std::string& id_for(const Writable& writable);

  /**
   * Forgets all ID assignments, so the next write pass assigns fresh ones.  Previously generated IDs are still never
   * reused.
   */
  void clear_ids();

  /**
   * The options.
   *
   * @return See above.
   */
  const Recording_options& options() const;

protected:
  // Constructors/destructor.

  /**
   * Constructs the writer.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging; null means no logging.
   * @param opts
   *        Options; copied.  Recording_options::m_id_indicator prefixes generated IDs.
   */
  explicit Object_writer(flow::log::Logger* logger_ptr, const Recording_options& opts);

  /// Boring destructor.
  ~Object_writer();

private:
  // Data.

  /// See options().
  const Recording_options m_opts;

  /// Generates the IDs.
  util::Id_generator m_id_generator;

  /// Object address to its ID.
  boost::unordered_map<const Writable*, std::string> m_ids;
}; // class Object_writer

} // namespace utopia::recording
