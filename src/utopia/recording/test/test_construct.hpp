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

#include "utopia/recording/writable.hpp"
#include <boost/shared_ptr.hpp>
#include <boost/weak_ptr.hpp>
#include <boost/make_shared.hpp>
#include <string>
#include <utility>
#include <vector>

namespace utopia::recording::test
{

/**
 * A minimal construct for the recording tests: a bag of attributes and weakly held links, writable back out.
 * It also keeps a log of set_link() calls, so tests can check how links were resolved.
 */
class Test_construct :
  public Writable
{
public:
  /// Short-hand for ref-counted pointer to `*this` type.
  using Ptr = boost::shared_ptr<Test_construct>;

  explicit Test_construct(const std::string& instruction) :
    m_instruction(instruction)
  {
    // Nothing else.
  }

  /// Factory suitable for Constructor.
  static Ptr create(const std::string& instruction)
  {
    return boost::make_shared<Test_construct>(instruction);
  }

  void set_id(const std::string& id)
  {
    m_id = id;
  }

  void set_attribute(const std::string& name, const std::string& value)
  {
    m_attributes[name] = value;
  }

  void set_link(const std::string& name, const Ptr& target)
  {
    m_links[name] = target;
    m_link_log.emplace_back(name, target->m_id);
  }

  Attributes attributes() const override
  {
    return m_attributes;
  }

  Links links() const override
  {
    Links links;
    for (const auto& name_and_target : m_links)
    {
      links[name_and_target.first] = name_and_target.second.lock().get();
    }
    return links;
  }

  /// The linked construct, or null.
  Ptr link(const std::string& name) const
  {
    const auto it = m_links.find(name);
    return (it == m_links.end()) ? Ptr() : it->second.lock();
  }

  /// The attribute value, or empty.
  std::string attribute(const std::string& name) const
  {
    const auto it = m_attributes.find(name);
    return (it == m_attributes.end()) ? std::string() : it->second;
  }

  /// Instruction given to the factory.
  const std::string m_instruction;

  /// Set by set_id().
  std::string m_id;

  /// Every set_link() call in order: (link name, target ID).
  std::vector<std::pair<std::string, std::string>> m_link_log;

private:
  /// See attributes().
  Attributes m_attributes;

  /// Weak, so cycles do not leak.
  std::map<std::string, boost::weak_ptr<Test_construct>> m_links;
}; // class Test_construct

} // namespace utopia::recording::test
