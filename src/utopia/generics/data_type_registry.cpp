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
#include "utopia/generics/data_type_registry.hpp"
#include "utopia/generics/basic_value_parser.hpp"
#include "utopia/generics/error/error.hpp"
#include <flow/error/error.hpp>
#include <flow/util/util.hpp>
#include <boost/make_shared.hpp>
#include <algorithm>
#include <functional>
#include <queue>

namespace utopia::generics
{

// Data_type_registry implementations.

Data_type_registry::Data_type_registry(flow::log::Logger* logger_ptr) :
  flow::log::Log_context(logger_ptr, Log_component::S_GENERICS)
{
  // Nothing else.
}

Data_type_registry::Data_type_registry(Data_type_registry&& src_moved) = default;

Data_type_registry& Data_type_registry::operator=(Data_type_registry&& src_moved) = default;

Data_type_registry Data_type_registry::create_with_basic_types(flow::log::Logger* logger_ptr)
{
  namespace types = basic_types;

  Data_type_registry registry(logger_ptr);

  // None of these can fail, so let any (impossible) error throw.
  for (const auto type : { &types::string(), &types::number(), &types::boolean(), &types::extra_boolean(),
                           &types::date(), &types::date_time(), &types::variable(), &types::model() })
  {
    registry.register_type(*type);
  }
  for (const auto type : { &types::integer(), &types::long_(), &types::double_() })
  {
    registry.register_type(*type, types::number());
  }

  registry.add_parser(boost::make_shared<Basic_value_parser>(logger_ptr), true);
  return registry;
}

void Data_type_registry::register_type(const Data_type& type, const boost::optional<Data_type>& parent,
                                       Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { register_type(type, parent, actual_err_code); },
         err_code, FLOW_UTIL_WHERE_AM_I_STR()))
  {
    return;
  }
  // else
  err_code->clear();

  if (parent)
  {
    if (!contains(*parent))
    {
      FLOW_LOG_WARNING("Cannot register type [" << type << "] under unregistered parent [" << *parent << "].");
      FLOW_ERROR_EMIT_ERROR(error::Code::S_DATA_TYPE_NOT_REGISTERED);
      return;
    }
    // else

    // Walk up from the would-be parent; meeting `type` on the way means `type` would become its own ancestor.
    for (boost::optional<Data_type> ancestor = parent; ancestor; ancestor = parent_of(*ancestor))
    {
      if (*ancestor == type)
      {
        FLOW_LOG_WARNING("Cannot register type [" << type << "] under parent [" << *parent << "]: that would "
                           "make the type its own ancestor.");
        FLOW_ERROR_EMIT_ERROR(error::Code::S_DATA_TYPE_HIERARCHY_CYCLE);
        return;
      }
    }
  } // if (parent)

  const bool replacing = contains(type);
  if (replacing)
  {
    // The old node goes, and with it every child's link to it.
    for (auto& type_and_parent : m_parents)
    {
      if (type_and_parent.second && (*type_and_parent.second == type))
      {
        FLOW_LOG_TRACE("Type [" << type_and_parent.first << "] loses its parent [" << type << "], which is being "
                         "replaced; it is now a root.");
        type_and_parent.second = boost::none;
      }
    }
  }

  m_parents[type] = parent;

  if (parent)
  {
    FLOW_LOG_INFO((replacing ? "Replaced" : "Registered") << " type [" << type << "] as a child of "
                    "[" << *parent << "].");
  }
  else
  {
    FLOW_LOG_INFO((replacing ? "Replaced" : "Registered") << " type [" << type << "] as a root.");
  }
} // Data_type_registry::register_type()

bool Data_type_registry::contains(const Data_type& type) const
{
  return util::key_exists(m_parents, type);
}

boost::optional<Data_type> Data_type_registry::parent_of(const Data_type& type) const
{
  const auto it = m_parents.find(type);
  return (it == m_parents.end()) ? boost::none : it->second;
}

bool Data_type_registry::is_of_type(const Data_type& type, const Data_type& candidate_ancestor,
                                    Error_code* err_code) const
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(bool, is_of_type, type, candidate_ancestor, _1);
  // We are in non-null err_code mode.
  err_code->clear();

  if (!contains(type))
  {
    FLOW_LOG_WARNING("Type [" << type << "] is not registered; cannot check whether it is a "
                       "[" << candidate_ancestor << "].");
    FLOW_ERROR_EMIT_ERROR(error::Code::S_DATA_TYPE_NOT_REGISTERED);
    return false;
  }
  // else

  // Terminates: register_type() never lets a chain cycle.
  for (boost::optional<Data_type> ancestor = type; ancestor; ancestor = parent_of(*ancestor))
  {
    if (*ancestor == candidate_ancestor)
    {
      return true;
    }
  }
  return false;
}

void Data_type_registry::add_parser(const Value_parser_ptr& parser, bool is_primary)
{
  const auto found = std::find_if(m_parsers.begin(), m_parsers.end(),
                                  [&](const Parser_entry& entry) { return entry.m_parser == parser; });
  if (found != m_parsers.end())
  {
    FLOW_LOG_TRACE("Parser [" << parser.get() << "] is already installed; ignoring.");
    return;
  }
  // else

  Parser_entry entry{ parser, parser->input_types(), parser->output_types() };
  if (is_primary)
  {
    m_parsers.insert(m_parsers.begin(), std::move(entry));
  }
  else
  {
    m_parsers.push_back(std::move(entry));
  }

  FLOW_LOG_INFO("Installed parser [" << parser.get() << "] as " << (is_primary ? "primary" : "secondary") << "; "
                  "chain length is now [" << m_parsers.size() << "].");

  rebuild_conversion_graph();
}

void Data_type_registry::rebuild_conversion_graph()
{
  m_input_types.clear();
  m_output_types.clear();
  m_graph.clear();
  m_route_cache.clear();

  size_t n_edges = 0;
  for (const auto& entry : m_parsers)
  {
    m_input_types.insert(entry.m_input_types.begin(), entry.m_input_types.end());
    m_output_types.insert(entry.m_output_types.begin(), entry.m_output_types.end());

    for (const auto& conversion : entry.m_parser->conversions())
    {
      m_graph[conversion.m_from].push_back({ conversion.m_to, conversion.m_reliability, entry.m_parser });
      ++n_edges;
    }
  }

  FLOW_LOG_TRACE("Conversion graph rebuilt: [" << m_graph.size() << "] source types; [" << n_edges << "] edges.");
}

Value Data_type_registry::convert(const Value& value, const Data_type& to, Error_code* err_code) const
{
  if (!err_code)
  {
    // Not using FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(): the context should describe the conversion.
    Error_code our_err_code;
    auto result = convert(value, to, &our_err_code);
    if (our_err_code)
    {
      throw flow::error::Runtime_error(our_err_code, conversion_description(value, to));
    }
    return result;
  }
  // else
  err_code->clear();

  const auto& from = value.type();
  if (from == to)
  {
    return value;
  }
  if (value.is_null())
  {
    return Value::null(to);
  }
  // else

  for (const auto& entry : m_parsers)
  {
    if (util::key_exists(entry.m_input_types, from) && util::key_exists(entry.m_output_types, to))
    {
      Error_code parse_err_code;
      auto result = entry.m_parser->parse(value, to, &parse_err_code);
      if (parse_err_code)
      {
        FLOW_LOG_WARNING(conversion_description(value, to) << ": parser [" << entry.m_parser.get() << "] "
                           "failed with [" << parse_err_code << "] [" << parse_err_code.message() << "].");
        FLOW_ERROR_EMIT_ERROR(error::Code::S_VALUE_PARSE_FAILED);
        return Value();
      }
      // else
      return result;
    }
  }

  FLOW_LOG_WARNING(conversion_description(value, to) << ": no installed parser converts between these types.");
  FLOW_ERROR_EMIT_ERROR(error::Code::S_NO_PARSER_FOR_CONVERSION);
  return Value();
} // Data_type_registry::convert()

Value Data_type_registry::convert_along_route(const Value& value, const Data_type& to, Error_code* err_code) const
{
  if (!err_code)
  {
    Error_code our_err_code;
    auto result = convert_along_route(value, to, &our_err_code);
    if (our_err_code)
    {
      throw flow::error::Runtime_error(our_err_code, conversion_description(value, to));
    }
    return result;
  }
  // else
  err_code->clear();

  const auto& from = value.type();
  if (from == to)
  {
    return value;
  }
  if (value.is_null())
  {
    return Value::null(to);
  }
  // else

  const auto& route = cheapest_route(from, to);
  if (route.m_cost < 0)
  {
    FLOW_LOG_WARNING(conversion_description(value, to) << ": no route of declared conversions.");
    FLOW_ERROR_EMIT_ERROR(error::Code::S_NO_PARSER_FOR_CONVERSION);
    return Value();
  }
  // else

  Value current = value;
  for (const auto& step : route.m_steps)
  {
    Error_code parse_err_code;
    auto next = step.m_parser->parse(current, step.m_to, &parse_err_code);
    if (parse_err_code)
    {
      FLOW_LOG_WARNING(conversion_description(value, to) << ": step [" << current.description() << "] to "
                         "[" << step.m_to << "] failed with [" << parse_err_code << "] "
                         "[" << parse_err_code.message() << "].");
      FLOW_ERROR_EMIT_ERROR(error::Code::S_VALUE_PARSE_FAILED);
      return Value();
    }
    current = std::move(next);
  }
  return current;
} // Data_type_registry::convert_along_route()

Conversion_reliability Data_type_registry::conversion_reliability(const Data_type& from, const Data_type& to) const
{
  if (from == to)
  {
    return Conversion_reliability::S_PERFECT;
  }
  // else

  const auto& route = cheapest_route(from, to);
  if (route.m_cost < 0)
  {
    return Conversion_reliability::S_NO_CONVERSION;
  }
  // else

  auto worst = Conversion_reliability::S_PERFECT;
  for (const auto& step : route.m_steps)
  {
    worst = worse_of(worst, step.m_reliability);
  }
  return worst;
}

int Data_type_registry::conversion_cost(const Data_type& from, const Data_type& to) const
{
  return (from == to) ? 0 : cheapest_route(from, to).m_cost;
}

bool Data_type_registry::conversion_possible(const Data_type& from, const Data_type& to) const
{
  return conversion_cost(from, to) >= 0;
}

boost::optional<Data_type>
  Data_type_registry::find_optimal_target_type(const Data_type& from, const std::vector<Data_type>& candidates) const
{
  boost::optional<Data_type> best;
  int best_cost = -1;
  for (const auto& candidate : candidates)
  {
    const int cost = conversion_cost(from, candidate);
    if ((cost >= 0) && ((!best) || (cost < best_cost)))
    {
      best = candidate;
      best_cost = cost;
    }
  }
  return best;
}

const Data_type_registry::Type_set& Data_type_registry::input_types() const
{
  return m_input_types;
}

const Data_type_registry::Type_set& Data_type_registry::output_types() const
{
  return m_output_types;
}

const Data_type_registry::Route& Data_type_registry::cheapest_route(const Data_type& from, const Data_type& to) const
{
  const Type_pair key(from, to);
  auto it = m_route_cache.find(key);
  if (it == m_route_cache.end())
  {
    it = m_route_cache.emplace(key, compute_route(from, to)).first;
  }
  return it->second;
}

Data_type_registry::Route Data_type_registry::compute_route(const Data_type& from, const Data_type& to) const
{
  // Plain Dijkstra.  Queue ties are broken by type name, so results do not depend on hash order.
  using Queue_item = std::pair<int, Data_type>;
  std::priority_queue<Queue_item, std::vector<Queue_item>, std::greater<Queue_item>> queue;

  /// How a type was reached on its best known route.
  struct Arrival
  {
    /// The type the edge left from.
    Data_type m_via;
    /// The edge.
    const Edge* m_edge;
  };

  boost::unordered_map<Data_type, int> costs;
  boost::unordered_map<Data_type, Arrival> arrivals;

  costs[from] = 0;
  queue.push(Queue_item(0, from));

  while (!queue.empty())
  {
    const auto item = queue.top();
    queue.pop();

    const int cost = item.first;
    const auto& node = item.second;
    if (cost > costs[node])
    {
      continue; // Stale entry.
    }
    if (node == to)
    {
      break;
    }

    const auto edges_it = m_graph.find(node);
    if (edges_it == m_graph.end())
    {
      continue;
    }
    for (const auto& edge : edges_it->second)
    {
      const int new_cost = cost + conversion_step_cost(edge.m_reliability);
      const auto cost_it = costs.find(edge.m_to);
      if ((cost_it == costs.end()) || (new_cost < cost_it->second))
      {
        costs[edge.m_to] = new_cost;
        arrivals[edge.m_to] = Arrival{ node, &edge };
        queue.push(Queue_item(new_cost, edge.m_to));
      }
    }
  } // while (!queue.empty())

  Route route{ {}, -1 };
  const auto cost_it = costs.find(to);
  if (cost_it == costs.end())
  {
    FLOW_LOG_TRACE("No conversion route from [" << from << "] to [" << to << "].");
    return route;
  }
  // else

  route.m_cost = cost_it->second;
  for (Data_type node = to; node != from; )
  {
    const auto& arrival = arrivals[node];
    route.m_steps.push_back(*arrival.m_edge);
    node = arrival.m_via;
  }
  std::reverse(route.m_steps.begin(), route.m_steps.end());

  FLOW_LOG_TRACE("Cheapest conversion route from [" << from << "] to [" << to << "]: "
                   "[" << route.m_steps.size() << "] steps; cost [" << route.m_cost << "].");
  return route;
} // Data_type_registry::compute_route()

std::string Data_type_registry::conversion_description(const Value& value, const Data_type& to)
{
  return util::ostream_op_string("Conversion of value [", value.description(), "] from [", value.type(), "] to "
                                 "[", to, "] failed");
}

} // namespace utopia::generics
