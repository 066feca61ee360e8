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
#include <map>
#include <string>

namespace utopia::recording
{

/**
 * Interface of an object that an Object_writer can write: it exposes its state as attributes (name to string
 * value) and links (name to another Writable).  Both maps are ordered, and the writers follow that order, so output
 * is deterministic.
 *
 * A Writable is identified by its address: Object_writer::id_for() memoizes IDs per `const Writable*`.  So a
 * Writable must stay at the same address for as long as a writer may be asked about it.
 */
class Writable
{
public:
  // Types.

  /// Attribute name to value.
  using Attributes = std::map<std::string, std::string>;

  /// Link name to the linked object; null pointers are skipped by writers.
  using Links = std::map<std::string, const Writable*>;

  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~Writable() = default;

  // Methods.

  /**
   * The attributes to write.
   *
   * @return See above.
   */
  virtual Attributes attributes() const = 0;

  /**
   * The links to write.
   *
   * @return See above.
   */
  virtual Links links() const = 0;
}; // class Writable

} // namespace utopia::recording
