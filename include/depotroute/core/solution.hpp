/* Plan result types and assignment -> routes reconstruction. */
#pragma once

#include <string>
#include <vector>

#include "depotroute/core/location_graph.hpp"
#include "depotroute/core/model_builder.hpp"
#include "depotroute/core/objective.hpp"
#include "depotroute/core/options.hpp"
#include "depotroute/core/solver.hpp"
#include "depotroute/core/types.hpp"

namespace depotroute::core {

struct DirectShipment {
  std::string location;
  Money cost { 0.0 };
};

// One location on a route. The first stop is the start anchor with zero legs.
struct RouteStop {
  std::string location;
  Minutes leg_time { 0.0 };
  Money leg_cost { 0.0 };
  Minutes cumulative_time { 0.0 };
  Money cumulative_cost { 0.0 };
};

struct Route {
  std::vector<RouteStop> stops;
  Minutes total_time { 0.0 };
  Money total_cost { 0.0 };

  // Locations strictly between start and end.
  [[nodiscard]] std::vector<std::string> visited() const;
};

// PlanResult is produced once per run and is not mutated afterwards.
struct PlanResult {
  std::vector<DirectShipment> direct;
  std::vector<Route> routes;
  Money direct_cost { 0.0 };
  Money route_cost { 0.0 };
  Money total_cost { 0.0 };
  // Objective reported by the solver; equals total_cost up to tolerances.
  double objective_value { 0.0 };
  SolveStatus status { SolveStatus::Optimal };
};

// Follow selected arcs from start to end for each used route and collect
// direct shipments. Throws ReconstructionError when the assignment does not
// decompose into simple start->end paths covering every location once, or
// when a route exceeds the budget.
[[nodiscard]] PlanResult extract_solution(const LocationGraph& g,
                                          const RoutingModel& m,
                                          const ObjectiveCoefficients& coefs,
                                          const PlanOptions& opts,
                                          const SolverOutcome& outcome);

} // namespace depotroute::core
