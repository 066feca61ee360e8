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
#include "utopia/util/id_generator.hpp"
#include <algorithm>
#include <limits>

namespace utopia::util
{

// Static initializations.

const std::string Id_generator::S_DEFAULT_ID_INDICATOR = "#";

// Implementations.

Id_generator::Id_generator(flow::log::Logger* logger_ptr, util::String_view id_indicator) :
  flow::log::Log_context(logger_ptr, Log_component::S_UTIL),
  m_id_indicator(id_indicator),
  m_rnd_magnitude(0, uint64_t(std::numeric_limits<int64_t>::max()))
{
  // Nothing else.
}

Id_generator::Id_generator(flow::log::Logger* logger_ptr, util::String_view id_indicator, uint64_t seed) :
  flow::log::Log_context(logger_ptr, Log_component::S_UTIL),
  m_id_indicator(id_indicator),
  m_rnd_magnitude(seed, 0, uint64_t(std::numeric_limits<int64_t>::max()))
{
  // Nothing else.
}

std::string Id_generator::generate()
{
  using std::string;

  while (true)
  {
    string id = m_id_indicator;
    id += to_base_36(m_rnd_magnitude());

    // insert() tells us whether it was new; if so it is now also recorded, so it will never be handed out again.
    if (m_used_ids.insert(id).second)
    {
      FLOW_LOG_TRACE("Id_generator [" << this << "]: Generated ID [" << id << "]; "
                       "[" << m_used_ids.size() << "] IDs used so far.");
      return id;
    }
    // else

    FLOW_LOG_INFO("Id_generator [" << this << "]: Random ID [" << id << "] was already in use; "
                    "drawing again.  This should be extremely rare.");
  }
} // Id_generator::generate()

void Id_generator::reserve(util::String_view id)
{
  if (m_used_ids.emplace(id).second)
  {
    FLOW_LOG_TRACE("Id_generator [" << this << "]: Reserved ID [" << id << "].");
  }
}

bool Id_generator::is_used(util::String_view id) const
{
  return m_used_ids.find(std::string(id)) != m_used_ids.end();
}

size_t Id_generator::used_count() const
{
  return m_used_ids.size();
}

const std::string& Id_generator::id_indicator() const
{
  return m_id_indicator;
}

std::string Id_generator::to_base_36(uint64_t num) // Static.
{
  using std::string;

  constexpr char DIGITS[] = "0123456789abcdefghijklmnopqrstuvwxyz";

  if (num == 0)
  {
    return "0";
  }
  // else

  string result;
  while (num != 0)
  {
    result += DIGITS[num % 36];
    num /= 36;
  }
  std::reverse(result.begin(), result.end());
  return result;
} // Id_generator::to_base_36()

} // namespace utopia::util
