/* Linear cost composition for the two supported cost models. */
#pragma once

#include <cstdint>
#include <vector>

#include "depotroute/core/location_graph.hpp"
#include "depotroute/core/model_builder.hpp"
#include "depotroute/core/options.hpp"
#include "depotroute/core/types.hpp"

namespace depotroute::core {

// Per-location direct-ship cost and per-pair drive cost. Pair costs exist
// only where the graph defines the data the cost model needs.
struct ObjectiveCoefficients {
  std::int32_t num_nodes { 0 };
  std::vector<Money> direct_cost {};
  std::vector<Money> arc_cost {};           // row-major N x N
  std::vector<std::uint8_t> has_arc_cost {};

  [[nodiscard]] bool has_cost(NodeId a, NodeId b) const {
    return has_arc_cost.at(static_cast<std::size_t>(a) * static_cast<std::size_t>(num_nodes) + static_cast<std::size_t>(b)) != 0;
  }
  // Throws std::out_of_range when the pair has no cost.
  [[nodiscard]] Money cost(NodeId a, NodeId b) const;
};

// Pure function of (cost options, graph).
//   Flat:     cost(a,b) = cost_per_minute * time(a,b)
//   Itemized: cost(a,b) = gas_cost_per_mile * distance(a,b) + staff_cost_per_hour * time(a,b) / 60
[[nodiscard]] ObjectiveCoefficients compose_objective(const LocationGraph& g, const CostOptions& cost);

// Write the coefficients onto the model's direct-ship and arc variables.
// Arcs without a cost are expected to be pinned to zero by the builder.
void apply_objective(RoutingModel& m, const ObjectiveCoefficients& c);

} // namespace depotroute::core
