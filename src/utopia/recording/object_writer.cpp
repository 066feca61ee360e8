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
#include "utopia/recording/object_writer.hpp"

namespace utopia::recording
{

Object_writer::Object_writer(flow::log::Logger* logger_ptr, const Recording_options& opts) :
  flow::log::Log_context(logger_ptr, Log_component::S_RECORDING),
  m_opts(opts),
  m_id_generator(logger_ptr, m_opts.m_id_indicator)
{
  // Nothing else.
}

Object_writer::~Object_writer() = default;

const std::string& Object_writer::id_for(const Writable& writable)
{
  auto it = m_ids.find(&writable);
  if (it == m_ids.end())
  {
    it = m_ids.emplace(&writable, m_id_generator.generate()).first;
    FLOW_LOG_TRACE("Object [" << &writable << "] assigned ID [" << it->second << "].");
  }
  return it->second;
}

void Object_writer::clear_ids()
{
  FLOW_LOG_TRACE("Forgetting [" << m_ids.size() << "] ID assignments.");
  m_ids.clear();
}

const Recording_options& Object_writer::options() const
{
  return m_opts;
}

} // namespace utopia::recording
