/*
  compose_objective / apply_objective — direct-ship costs plus per-arc drive
  costs, linear in the decision variables for both cost models.
*/
#include "depotroute/core/objective.hpp"

#include <stdexcept>

namespace depotroute::core {

Money ObjectiveCoefficients::cost(NodeId a, NodeId b) const {
  if (!has_cost(a, b)) {
    throw std::out_of_range("no drive cost for requested pair");
  }
  return arc_cost[static_cast<std::size_t>(a) * static_cast<std::size_t>(num_nodes) + static_cast<std::size_t>(b)];
}

ObjectiveCoefficients compose_objective(const LocationGraph& g, const CostOptions& cost) {
  ObjectiveCoefficients c;
  c.num_nodes = g.num_locations();
  const auto N = static_cast<std::size_t>(c.num_nodes);
  c.direct_cost.resize(N);
  for (NodeId n = 0; n < c.num_nodes; ++n) {
    c.direct_cost[static_cast<std::size_t>(n)] = g.location(n).direct_cost;
  }
  c.arc_cost.assign(N * N, 0.0);
  c.has_arc_cost.assign(N * N, 0);
  for (NodeId a = 0; a < c.num_nodes; ++a) {
    for (NodeId b = 0; b < c.num_nodes; ++b) {
      if (!g.has_edge(a, b)) continue;
      const auto s = static_cast<std::size_t>(a) * N + static_cast<std::size_t>(b);
      switch (cost.model) {
        case CostModel::Flat:
          c.arc_cost[s] = cost.cost_per_minute * g.time(a, b);
          break;
        case CostModel::Itemized:
          if (!g.has_distance(a, b)) continue;
          c.arc_cost[s] = cost.gas_cost_per_mile * g.distance(a, b) +
                          cost.staff_cost_per_hour * g.time(a, b) / 60.0;
          break;
      }
      c.has_arc_cost[s] = 1;
    }
  }
  return c;
}

void apply_objective(RoutingModel& m, const ObjectiveCoefficients& c) {
  if (c.num_nodes != m.num_nodes) {
    throw std::invalid_argument("apply_objective: coefficient table does not match model");
  }
  for (NodeId n : m.covered) {
    m.mip.add_objective(m.direct_var(n), c.direct_cost[static_cast<std::size_t>(n)]);
  }
  for (RouteId r = 0; r < m.num_routes; ++r) {
    for (NodeId a = 0; a < m.num_nodes; ++a) {
      for (NodeId b = 0; b < m.num_nodes; ++b) {
        VarId v = m.arc_var(r, a, b);
        if (v == kNoVar || !c.has_cost(a, b)) continue;
        m.mip.add_objective(v, c.cost(a, b));
      }
    }
  }
}

} // namespace depotroute::core
