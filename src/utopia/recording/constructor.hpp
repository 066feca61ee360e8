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
#include "utopia/recording/error/error.hpp"
#include <flow/error/error.hpp>
#include <flow/log/log.hpp>
#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/unordered_map.hpp>
#include <algorithm>
#include <deque>
#include <string>
#include <vector>

namespace utopia::recording
{

/**
 * Builds a graph of interlinked objects (*constructs*) from a flat stream of instructions: create(), add_attribute(),
 * add_link(), set_instruction(), move_to().  Attribute and link instructions apply to the *latest* construct: the one
 * most recently created or moved to.
 *
 * A link may name an ID that has not been created yet (a forward reference).  Such a link is queued under the
 * target ID and resolved -- exactly once, in the order the links were added -- as soon as create() makes that ID.
 * So cyclic graphs replay fine.  Links still pending at the end of a session are *unresolved*; see finish().
 *
 * The session state (ID-to-construct map, pending links, latest construct, ambient instruction) lives until
 * reset() or destruction.  The Constructor keeps each created construct alive (via #Construct_ptr) for that long;
 * once it is reset the constructs live only as long as the user's own references.
 *
 * ### `Construct` requirements ###
 * No base class is needed.  Given `Construct c` and `boost::shared_ptr<Construct> p`, these must compile:
 *   - `c.set_id(std::string)`: called once, right after the factory made `c`.
 *   - `c.set_attribute(std::string name, std::string value)`.
 *   - `c.set_link(std::string name, p)`: `p` is never null.  If links may form cycles, `Construct` should store
 *     them as `boost::weak_ptr`, lest the objects never be freed.
 *
 * New constructs come from the #Factory given to the constructor, which receives the current instruction()
 * (possibly empty).  This is where the user decides what concrete object an instruction calls for.
 *
 * ### Error reporting ###
 * Errors are reported immediately (via the usual `Error_code* err_code` convention) and leave the state as it was;
 * nothing is retried later.
 *
 * ### Thread safety ###
 * Not safe for concurrent access of any kind, including concurrent `const` access with a non-`const` one.
 *
 * @tparam Construct
 *         The object type; see above.
 */
template<typename Construct>
class Constructor :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /// Short-hand for the ref-counted pointer through which constructs are owned.
  using Construct_ptr = boost::shared_ptr<Construct>;

  /// Makes a new construct for the given instruction; returns null on failure.
  using Factory = Function<Construct_ptr (const std::string& instruction)>;

  /// ID to construct.
  using Construct_map = boost::unordered_map<std::string, Construct_ptr>;

  // Constructors/destructor.

  /**
   * Constructs an empty session.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging; null means no logging.
   * @param factory
   *        Makes new constructs; see class doc header.
   * @param opts
   *        Options; copied.  Only Recording_options::m_report_unresolved_links matters here.
   */
  explicit Constructor(flow::log::Logger* logger_ptr, Factory factory,
                       const Recording_options& opts = Recording_options());

  // Methods.

  /**
   * Creates a construct via the factory, gives it the ID, and makes it the latest construct; then resolves, in
   * order, every pending link to `id`.
   *
   * @param id
   *        ID; must not have been created in this session.
   * @param err_code
   *        See utopia::Error_code docs for error reporting semantics.  Generated error codes:
   *        recording::error::Code::S_DUPLICATE_ID, recording::error::Code::S_CONSTRUCT_CREATION_FAILED.
   */
  void create(const std::string& id, Error_code* err_code = 0);

  /**
   * Sets an attribute on the latest construct.
   *
   * @param name
   *        Attribute name.
   * @param value
   *        Value.
   * @param err_code
   *        See utopia::Error_code docs for error reporting semantics.  Generated error codes:
   *        recording::error::Code::S_NO_CONSTRUCT_YET.
   */
  void add_attribute(const std::string& name, const std::string& value, Error_code* err_code = 0);

  /**
   * Links the latest construct's attribute `name` to the construct with ID `target_id`: immediately, if it exists;
   * else once it is created.
   *
   * @param name
   *        Link name.
   * @param target_id
   *        ID of the target.
   * @param err_code
   *        See utopia::Error_code docs for error reporting semantics.  Generated error codes:
   *        recording::error::Code::S_NO_CONSTRUCT_YET.
   */
  void add_link(const std::string& name, const std::string& target_id, Error_code* err_code = 0);

  /**
   * Sets the ambient instruction passed to the factory by subsequent create() calls.
   *
   * @param instruction
   *        Instruction; may be empty.
   */
  void set_instruction(util::String_view instruction);

  /**
   * The ambient instruction.
   *
   * @return See above.
   */
  const std::string& instruction() const;

  /**
   * Makes the construct with the given ID the latest construct.
   *
   * @param id
   *        ID.
   * @param err_code
   *        See utopia::Error_code docs for error reporting semantics.  Generated error codes:
   *        recording::error::Code::S_UNKNOWN_ID.
   */
  void move_to(const std::string& id, Error_code* err_code = 0);

  /**
   * Makes the given construct the latest construct, whether or not this session created it.
   *
   * @param construct
   *        Construct; may be null, which makes subsequent add_attribute() and add_link() fail.
   */
  void move_to(const Construct_ptr& construct);

  /// Forgets all session state: constructs, pending links, latest construct, instruction.
  void reset();

  /**
   * Ends a session.  If links are still pending, logs a warning naming the IDs they wait for, and fails if
   * Recording_options::m_report_unresolved_links.  Either way the state is unchanged.
   *
   * @param err_code
   *        See utopia::Error_code docs for error reporting semantics.  Generated error codes:
   *        recording::error::Code::S_UNRESOLVED_LINKS.
   */
  void finish(Error_code* err_code = 0);

  /**
   * The target IDs with pending links, sorted.
   *
   * @return See above.
   */
  std::vector<std::string> unresolved_ids() const;

  /**
   * All constructs created in this session.
   *
   * @return See above.
   */
  const Construct_map& constructs() const;

  /**
   * The construct with the given ID; null if none.
   *
   * @param id
   *        ID.
   * @return See above.
   */
  Construct_ptr find(const std::string& id) const;

  /**
   * The latest construct; null if none.
   *
   * @return See above.
   */
  const Construct_ptr& latest_construct() const;

  /**
   * The options.
   *
   * @return See above.
   */
  const Recording_options& options() const;

private:
  // Types.

  /// A link waiting for its target to be created.
  struct Link_query
  {
    /// The construct whose link it is.
    Construct_ptr m_querier;
    /// The link name.
    std::string m_name;
  };

  // Data.

  /// See constructor.
  const Factory m_factory;

  /// See options().
  const Recording_options m_opts;

  /// See constructs().
  Construct_map m_constructs;

  /// Target ID to the links waiting for it, in the order they were added.
  boost::unordered_map<std::string, std::deque<Link_query>> m_pending_links;

  /// See latest_construct().
  Construct_ptr m_latest;

  /// See instruction().
  std::string m_instruction;
}; // class Constructor

// Template implementations.

template<typename Construct>
Constructor<Construct>::Constructor(flow::log::Logger* logger_ptr, Factory factory, const Recording_options& opts) :
  flow::log::Log_context(logger_ptr, Log_component::S_RECORDING),
  m_factory(std::move(factory)),
  m_opts(opts)
{
  // Nothing else.
}

template<typename Construct>
void Constructor<Construct>::create(const std::string& id, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { create(id, actual_err_code); },
         err_code, FLOW_UTIL_WHERE_AM_I_STR()))
  {
    return;
  }
  // else
  err_code->clear();

  if (m_constructs.find(id) != m_constructs.end())
  {
    FLOW_LOG_WARNING("Cannot create construct [" << id << "]: that ID already exists.");
    FLOW_ERROR_EMIT_ERROR(error::Code::S_DUPLICATE_ID);
    return;
  }
  // else

  auto construct = m_factory(m_instruction);
  if (!construct)
  {
    FLOW_LOG_WARNING("Cannot create construct [" << id << "]: the factory made nothing for instruction "
                       "[" << m_instruction << "].");
    FLOW_ERROR_EMIT_ERROR(error::Code::S_CONSTRUCT_CREATION_FAILED);
    return;
  }
  // else

  construct->set_id(id);
  m_constructs.emplace(id, construct);
  m_latest = construct;
  FLOW_LOG_TRACE("Created construct [" << id << "] for instruction [" << m_instruction << "].");

  const auto pending_it = m_pending_links.find(id);
  if (pending_it != m_pending_links.end())
  {
    FLOW_LOG_TRACE("Resolving [" << pending_it->second.size() << "] pending links to [" << id << "].");
    for (const auto& query : pending_it->second)
    {
      query.m_querier->set_link(query.m_name, construct);
    }
    m_pending_links.erase(pending_it);
  }
} // Constructor::create()

template<typename Construct>
void Constructor<Construct>::add_attribute(const std::string& name, const std::string& value, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { add_attribute(name, value, actual_err_code); },
         err_code, FLOW_UTIL_WHERE_AM_I_STR()))
  {
    return;
  }
  // else
  err_code->clear();

  if (!m_latest)
  {
    FLOW_LOG_WARNING("Cannot set attribute [" << name << "] = [" << value << "]: no construct yet.");
    FLOW_ERROR_EMIT_ERROR(error::Code::S_NO_CONSTRUCT_YET);
    return;
  }
  // else
  m_latest->set_attribute(name, value);
}

template<typename Construct>
void Constructor<Construct>::add_link(const std::string& name, const std::string& target_id, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { add_link(name, target_id, actual_err_code); },
         err_code, FLOW_UTIL_WHERE_AM_I_STR()))
  {
    return;
  }
  // else
  err_code->clear();

  if (!m_latest)
  {
    FLOW_LOG_WARNING("Cannot set link [" << name << "] -> [" << target_id << "]: no construct yet.");
    FLOW_ERROR_EMIT_ERROR(error::Code::S_NO_CONSTRUCT_YET);
    return;
  }
  // else

  const auto target_it = m_constructs.find(target_id);
  if (target_it != m_constructs.end())
  {
    m_latest->set_link(name, target_it->second);
    return;
  }
  // else

  FLOW_LOG_TRACE("Link [" << name << "] -> [" << target_id << "] is a forward reference; queued.");
  m_pending_links[target_id].push_back(Link_query{ m_latest, name });
}

template<typename Construct>
void Constructor<Construct>::set_instruction(util::String_view instruction)
{
  m_instruction = std::string(instruction);
}

template<typename Construct>
const std::string& Constructor<Construct>::instruction() const
{
  return m_instruction;
}

template<typename Construct>
void Constructor<Construct>::move_to(const std::string& id, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { move_to(id, actual_err_code); },
         err_code, FLOW_UTIL_WHERE_AM_I_STR()))
  {
    return;
  }
  // else
  err_code->clear();

  const auto it = m_constructs.find(id);
  if (it == m_constructs.end())
  {
    FLOW_LOG_WARNING("Cannot move to construct [" << id << "]: no such ID.");
    FLOW_ERROR_EMIT_ERROR(error::Code::S_UNKNOWN_ID);
    return;
  }
  // else
  m_latest = it->second;
}

template<typename Construct>
void Constructor<Construct>::move_to(const Construct_ptr& construct)
{
  m_latest = construct;
}

template<typename Construct>
void Constructor<Construct>::reset()
{
  FLOW_LOG_TRACE("Resetting: forgetting [" << m_constructs.size() << "] constructs and pending links to "
                   "[" << m_pending_links.size() << "] IDs.");
  m_constructs.clear();
  m_pending_links.clear();
  m_latest.reset();
  m_instruction.clear();
}

template<typename Construct>
void Constructor<Construct>::finish(Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { finish(actual_err_code); },
         err_code, FLOW_UTIL_WHERE_AM_I_STR()))
  {
    return;
  }
  // else
  err_code->clear();

  if (m_pending_links.empty())
  {
    return;
  }
  // else

  const auto ids = unresolved_ids();
  std::string ids_str;
  for (const auto& id : ids)
  {
    ids_str += ids_str.empty() ? "" : ", ";
    ids_str += id;
  }
  FLOW_LOG_WARNING("Finished with links to [" << ids.size() << "] never-created IDs: [" << ids_str << "].");

  if (m_opts.m_report_unresolved_links)
  {
    FLOW_ERROR_EMIT_ERROR(error::Code::S_UNRESOLVED_LINKS);
  }
}

template<typename Construct>
std::vector<std::string> Constructor<Construct>::unresolved_ids() const
{
  std::vector<std::string> ids;
  ids.reserve(m_pending_links.size());
  for (const auto& id_and_queries : m_pending_links)
  {
    ids.push_back(id_and_queries.first);
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

template<typename Construct>
const typename Constructor<Construct>::Construct_map& Constructor<Construct>::constructs() const
{
  return m_constructs;
}

template<typename Construct>
typename Constructor<Construct>::Construct_ptr Constructor<Construct>::find(const std::string& id) const
{
  const auto it = m_constructs.find(id);
  return (it == m_constructs.end()) ? Construct_ptr() : it->second;
}

template<typename Construct>
const typename Constructor<Construct>::Construct_ptr& Constructor<Construct>::latest_construct() const
{
  return m_latest;
}

template<typename Construct>
const Recording_options& Constructor<Construct>::options() const
{
  return m_opts;
}

} // namespace utopia::recording
