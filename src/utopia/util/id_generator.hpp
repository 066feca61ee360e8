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
#include <flow/util/random.hpp>
#include <flow/log/log.hpp>
#include <boost/unordered_set.hpp>
#include <string>

namespace utopia::util
{

/**
 * Produces string identifiers unique among those produced (and reserved) by the same instance.  Each generated ID
 * is the id indicator (#S_DEFAULT_ID_INDICATOR unless told otherwise) followed by the base-36 encoding (`0-9a-z`) of a
 * uniformly random non-negative 63-bit integer, e.g., `#3f9a0kq1zz1p`.
 *
 * The guarantee is instance-local: generate() never returns an ID previously returned by generate() or passed to
 * reserve() on the same Id_generator.  Two instances may well produce the same ID; nothing is persisted.
 *
 * The random magnitude is 63 bits wide, so a collision is astronomically unlikely; should one occur anyway,
 * generate() simply draws again until it finds an unused value.
 *
 * ### Thread safety ###
 * Not safe for concurrent non-`const` access.
 */
class Id_generator :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constants.

  /// The id indicator used by default: `#`.
  static const std::string S_DEFAULT_ID_INDICATOR;

  // Constructors/destructor.

  /**
   * Constructs generator with a time-based random seed and no used IDs.
   *
   * @param logger_ptr
   *        Logger to use subsequently; null disables logging.
   * @param id_indicator
   *        Prefix of each generated ID.
   */
  explicit Id_generator(flow::log::Logger* logger_ptr = 0,
                        util::String_view id_indicator = S_DEFAULT_ID_INDICATOR);

  /**
   * Constructs generator with the given random seed and no used IDs.  Given the same seed, the same sequence of
   * generate() results will follow (absent reserve() calls), which is useful in tests.
   *
   * @param logger_ptr
   *        See other constructor.
   * @param id_indicator
   *        See other constructor.
   * @param seed
   *        Random seed.
   */
  explicit Id_generator(flow::log::Logger* logger_ptr, util::String_view id_indicator, uint32_t seed);

  // Methods.

  /**
   * Returns a new ID never before returned by `*this` and not equal to any ID given to reserve().  The result is
   * itself recorded as used.
   *
   * @return See above.
   */
  std::string generate();

  /**
   * Marks the given externally chosen ID as used, so that generate() will never return it.  Reserving an already
   * used ID is harmless.
   *
   * @param id
   *        ID to reserve.  Normally it should begin with id_indicator(), but that is not enforced.
   */
  void reserve(util::String_view id);

  /**
   * Returns `true` if and only if the given ID has been returned by generate() or passed to reserve().
   *
   * @param id
   *        ID to check.
   * @return See above.
   */
  bool is_used(util::String_view id) const;

  /**
   * Number of distinct used IDs.
   *
   * @return See above.
   */
  size_t used_count() const;

  /**
   * The prefix of each generated ID.
   *
   * @return See above.
   */
  const std::string& id_indicator() const;

  /**
   * Encodes the given number in base 36, using digits `0-9` followed by lower-case `a-z`.  0 yields "0".
   *
   * @param num
   *        Number to encode.
   * @return See above.
   */
  static std::string to_base_36(uint64_t num);

private:
  // Data.

  /// See id_indicator().
  const std::string m_id_indicator;

  /// Source of the random magnitudes, in `[0, 2^63 - 1]`.
  flow::util::Rnd_gen_uniform_range<uint64_t> m_rnd_magnitude;

  /// Every ID generated or reserved so far.
  boost::unordered_set<std::string> m_used_ids;
}; // class Id_generator

} // namespace utopia::util
