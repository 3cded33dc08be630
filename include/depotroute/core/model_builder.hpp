/* Routing-with-direct-shipment MILP construction over a LocationGraph. */
#pragma once

#include <cstdint>
#include <vector>

#include "depotroute/core/location_graph.hpp"
#include "depotroute/core/mip_model.hpp"
#include "depotroute/core/options.hpp"
#include "depotroute/core/types.hpp"

namespace depotroute::core {

// RoutingModel couples the MILP with the index maps needed to read an
// assignment back. All maps are dense over graph NodeIds; kNoVar marks
// entries that have no variable (hub, anchors, excluded locations, arcs a
// route may never use).
struct RoutingModel {
  MipModel mip {};
  NodeId start { kNoNode };
  NodeId end { kNoNode };
  std::int32_t num_routes { 0 };
  std::int32_t num_nodes { 0 };
  // Locations subject to the coverage row, in NodeId order.
  std::vector<NodeId> covered {};
  // direct[n]: direct-ship indicator.
  std::vector<VarId> direct {};
  // arc[(r * N + a) * N + b]: route r drives a -> b.
  std::vector<VarId> arc {};
  // position[r * N + n]: sequence index of n on route r.
  std::vector<VarId> position {};
  // route_used[r]: route r leaves start.
  std::vector<VarId> route_used {};

  [[nodiscard]] VarId direct_var(NodeId n) const { return direct.at(static_cast<std::size_t>(n)); }
  [[nodiscard]] VarId arc_var(RouteId r, NodeId a, NodeId b) const {
    const auto N = static_cast<std::size_t>(num_nodes);
    return arc.at((static_cast<std::size_t>(r) * N + static_cast<std::size_t>(a)) * N + static_cast<std::size_t>(b));
  }
  [[nodiscard]] VarId position_var(RouteId r, NodeId n) const {
    return position.at(static_cast<std::size_t>(r) * static_cast<std::size_t>(num_nodes) + static_cast<std::size_t>(n));
  }
  [[nodiscard]] VarId route_used_var(RouteId r) const { return route_used.at(static_cast<std::size_t>(r)); }
};

// Build the generalized R-route model (R = opts.max_routes). The objective is
// left empty; see compose_objective/apply_objective.
//
// Throws ValidationError when the graph does not satisfy opts, and
// InfeasibleModel when a start/end anchor carries a force-direct override.
[[nodiscard]] RoutingModel build_routing_model(const LocationGraph& g, const PlanOptions& opts);

} // namespace depotroute::core
