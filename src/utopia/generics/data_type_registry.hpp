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

#include "utopia/generics/value_parser.hpp"
#include <flow/log/log.hpp>
#include <boost/functional/hash.hpp>
#include <boost/optional.hpp>
#include <boost/unordered_map.hpp>
#include <utility>
#include <vector>

namespace utopia::generics
{

/**
 * Owns the Data_type hierarchy (a forest of parent links) and an ordered chain of Value_parser%s, and uses the
 * latter to convert Value%s and to rank hypothetical conversions.
 *
 * There is no global instance.  Construct one -- typically via create_with_basic_types() -- keep it
 * alive as long as needed, and pass it by reference to the code that needs it (Value::cast_to() and friends,
 * the value operators).
 *
 * ### Two views of conversion ###
 * convert() is *direct*: it picks the first parser (in chain order) whose input type set contains the source type
 * and whose output type set contains the target type, and lets it do the whole job in one step.
 *
 * The *ranking* operations -- conversion_reliability(), conversion_cost(), conversion_possible(),
 * find_optimal_target_type() -- instead look at the conversion graph: nodes are Data_type%s, edges are the
 * (from, to, reliability) triples declared by all parsers, each weighted by its reliability's cost (see
 * Conversion_reliability).  The cheapest route (Dijkstra) wins; a route's reliability is that of its worst step.
 * convert_along_route() executes such a route step by step.  Cheapest routes are cached; the cache is cleared
 * whenever a parser is added.
 *
 * ### Thread safety ###
 * Even `const` methods are not safe to call concurrently, as they fill the route cache.  Typically a registry is
 * fully set up before use and then used from one thread.
 */
class Data_type_registry :
  public flow::log::Log_context
{
public:
  // Types.

  /// Set of types.
  using Type_set = Value_parser::Type_set;

  // Constructors/destructor.

  /**
   * Constructs an empty registry: no types, no parsers.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging; null means no logging.
   */
  explicit Data_type_registry(flow::log::Logger* logger_ptr = 0);

  /// Forbid copying; parsers are shared, but a hierarchy is not meant to be forked implicitly.
  Data_type_registry(const Data_type_registry&) = delete;

  /**
   * Move constructor.
   *
   * @param src_moved
   *        Source; becomes empty.
   */
  Data_type_registry(Data_type_registry&& src_moved);

  /**
   * Builds a registry with the basic types (see generics::basic_types) registered -- INTEGER, LONG, DOUBLE as
   * children of NUMBER, the others as roots -- and a Basic_value_parser installed as primary parser.
   *
   * @param logger_ptr
   *        Logger for the registry and the parser; null means no logging.
   * @return See above.
   */
  static Data_type_registry create_with_basic_types(flow::log::Logger* logger_ptr = 0);

  // Methods.

  /// Forbid copying.
  Data_type_registry& operator=(const Data_type_registry&) = delete;

  /**
   * Move assignment.
   *
   * @param src_moved
   *        Source; becomes empty.
   * @return `*this`.
   */
  Data_type_registry& operator=(Data_type_registry&& src_moved);

  /**
   * Registers `type`, optionally as a child of `parent`.  If `type` is already registered, it is replaced: its old
   * node goes away together with its children's links to it (those children become roots; re-register them to
   * restore the hierarchy), and the new node's parent is `parent`.
   *
   * The cycle check is made against the hierarchy as it stands before the call, even when `type` is being replaced:
   * `type` may not become a child of itself or of one of its current descendants.  So registering NUMBER under
   * INTEGER is refused while INTEGER is a child of NUMBER, although the replacement would have orphaned INTEGER.
   * To turn the hierarchy around, first register the child on its own (as a root), then the former parent under it.
   *
   * @param type
   *        Type to register.
   * @param parent
   *        Parent; or none for a root.
   * @param err_code
   *        See utopia::Error_code docs for error reporting semantics.  Generated error codes:
   *        generics::error::Code::S_DATA_TYPE_NOT_REGISTERED (`parent` is not registered),
   *        generics::error::Code::S_DATA_TYPE_HIERARCHY_CYCLE.
   *        On error nothing changes.
   */
  void register_type(const Data_type& type, const boost::optional<Data_type>& parent = boost::none,
                     Error_code* err_code = 0);

  /**
   * Whether `type` is registered.
   *
   * @param type
   *        Type.
   * @return See above.
   */
  bool contains(const Data_type& type) const;

  /**
   * The parent of `type`; none if `type` is a root or not registered.
   *
   * @param type
   *        Type.
   * @return See above.
   */
  boost::optional<Data_type> parent_of(const Data_type& type) const;

  /**
   * Whether `type` equals `candidate_ancestor` or descends from it.
   *
   * @param type
   *        Type.
   * @param candidate_ancestor
   *        Type; need not be registered.
   * @param err_code
   *        See utopia::Error_code docs for error reporting semantics.  Generated error codes:
   *        generics::error::Code::S_DATA_TYPE_NOT_REGISTERED (`type` is not registered).
   * @return See above.
   */
  bool is_of_type(const Data_type& type, const Data_type& candidate_ancestor, Error_code* err_code = 0) const;

  /**
   * Installs a parser: at the front of the chain if `is_primary`, else at the back.  Installing the same parser
   * object again (same pointer) does nothing.  Updates the aggregate type sets and the conversion graph and clears
   * the route cache.
   *
   * @param parser
   *        Parser; not null.
   * @param is_primary
   *        See above.
   */
  void add_parser(const Value_parser_ptr& parser, bool is_primary = false);

  /**
   * Converts `value` to `to` in one direct step.  If `value.type() == to`, returns `value` unchanged; if `value`
   * is null, returns `Value::null(to)`; otherwise uses the first parser (in chain order) whose input set contains
   * `value.type()` and whose output set contains `to`.
   *
   * Failures are logged along with the attempted value and both types; if thrown, the exception's context carries
   * the same description.
   *
   * @param value
   *        Source.
   * @param to
   *        Target type.
   * @param err_code
   *        See utopia::Error_code docs for error reporting semantics.  Generated error codes:
   *        generics::error::Code::S_NO_PARSER_FOR_CONVERSION, generics::error::Code::S_VALUE_PARSE_FAILED.
   * @return The converted value.
   */
  Value convert(const Value& value, const Data_type& to, Error_code* err_code = 0) const;

  /**
   * Like convert(), but follows the cheapest route through the conversion graph, one declared conversion (hence
   * one parser call) per step.
   *
   * @param value
   *        Source.
   * @param to
   *        Target type.
   * @param err_code
   *        See convert().  S_NO_PARSER_FOR_CONVERSION means there is no route.
   * @return The converted value.
   */
  Value convert_along_route(const Value& value, const Data_type& to, Error_code* err_code = 0) const;

  /**
   * PERFECT if `from == to`; otherwise the worst step reliability along the cheapest route; NO_CONVERSION if there
   * is no route.
   *
   * @param from
   *        Source type.
   * @param to
   *        Target type.
   * @return See above.
   */
  Conversion_reliability conversion_reliability(const Data_type& from, const Data_type& to) const;

  /**
   * Sum of step costs along the cheapest route: 0 if `from == to`; -1 if there is no route.
   *
   * @param from
   *        Source type.
   * @param to
   *        Target type.
   * @return See above.
   */
  int conversion_cost(const Data_type& from, const Data_type& to) const;

  /**
   * Whether a route exists (or `from == to`).
   *
   * @param from
   *        Source type.
   * @param to
   *        Target type.
   * @return See above.
   */
  bool conversion_possible(const Data_type& from, const Data_type& to) const;

  /**
   * Among `candidates`, the one reachable from `from` at the lowest conversion_cost(); ties go to the earlier
   * candidate.  None if no candidate is reachable.
   *
   * @param from
   *        Source type.
   * @param candidates
   *        Candidate target types.
   * @return See above.
   */
  boost::optional<Data_type> find_optimal_target_type(const Data_type& from,
                                                      const std::vector<Data_type>& candidates) const;

  /**
   * Union of the parsers' input type sets.
   *
   * @return See above.
   */
  const Type_set& input_types() const;

  /**
   * Union of the parsers' output type sets.
   *
   * @return See above.
   */
  const Type_set& output_types() const;

private:
  // Types.

  /// A parser in the chain, with its type sets computed once.
  struct Parser_entry
  {
    /// The parser.
    Value_parser_ptr m_parser;
    /// Its input_types().
    Type_set m_input_types;
    /// Its output_types().
    Type_set m_output_types;
  };

  /// An edge of the conversion graph; its source is the key under which it is stored.
  struct Edge
  {
    /// Target type.
    Data_type m_to;
    /// Declared reliability.
    Conversion_reliability m_reliability;
    /// The parser that declared it, and which will execute it.
    Value_parser_ptr m_parser;
  };

  /// A cheapest route.
  struct Route
  {
    /// The steps in order; empty if there is no route (or source equals target).
    std::vector<Edge> m_steps;
    /// Sum of step costs; -1 if there is no route.
    int m_cost;
  };

  /// Cache key: (from, to).
  using Type_pair = std::pair<Data_type, Data_type>;

  // Methods.

  /**
   * The cheapest route from `from` to `to`, from the cache or else computed (and cached).
   *
   * @param from
   *        Source type; not equal to `to`.
   * @param to
   *        Target type.
   * @return Reference valid until the cache is next modified.
   */
  const Route& cheapest_route(const Data_type& from, const Data_type& to) const;

  /**
   * Dijkstra over #m_graph.
   *
   * @param from
   *        Source type.
   * @param to
   *        Target type.
   * @return See above.
   */
  Route compute_route(const Data_type& from, const Data_type& to) const;

  /// Recomputes the aggregate type sets and the graph from #m_parsers; clears the cache.
  void rebuild_conversion_graph();

  /**
   * Text describing an attempted conversion, for logs and exceptions.
   *
   * @param value
   *        Source.
   * @param to
   *        Target type.
   * @return See above.
   */
  static std::string conversion_description(const Value& value, const Data_type& to);

  // Data.

  /// Each registered type mapped to its parent, if any.
  boost::unordered_map<Data_type, boost::optional<Data_type>> m_parents;

  /// The parser chain, primary first.
  std::vector<Parser_entry> m_parsers;

  /// See input_types().
  Type_set m_input_types;

  /// See output_types().
  Type_set m_output_types;

  /// Conversion graph: source type mapped to its out-edges, in parser-chain then declaration order.
  boost::unordered_map<Data_type, std::vector<Edge>> m_graph;

  /// Cheapest route cache; filled lazily by `const` methods.
  mutable boost::unordered_map<Type_pair, Route> m_route_cache;
}; // class Data_type_registry

} // namespace utopia::generics
