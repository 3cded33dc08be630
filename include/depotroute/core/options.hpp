/* Run configuration: budget, route count, cost model, anchors, solver knobs. */
#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "depotroute/core/types.hpp"

namespace depotroute::core {

[[nodiscard]] constexpr Minutes minutes_from_hours(double hours) noexcept { return hours * 60.0; }

struct CostOptions {
  CostModel model { CostModel::Flat };
  // Flat: route cost = cost_per_minute * arc time.
  Money cost_per_minute { 1.0 };
  // Itemized: route cost = gas_cost_per_mile * distance + staff_cost_per_hour * time / 60.
  Money gas_cost_per_mile { 0.0 };
  Money staff_cost_per_hour { 0.0 };
};

struct SolverOptions {
  // MPSolver backend id ("CBC", "SCIP", ...).
  std::string backend { "CBC" };
  // Wall-clock limit; unset means solve to proven optimality.
  std::optional<std::chrono::milliseconds> time_limit {};
  // 0 lets the backend choose.
  int num_threads { 0 };
  bool enable_output { false };
};

struct PlanOptions {
  Minutes max_drive_time { 0.0 };
  // 1 selects single-route mode.
  int max_routes { 1 };
  CostOptions cost {};
  // Anchors; both default to the hub. start == end yields closed tours.
  std::optional<std::string> start {};
  std::optional<std::string> end {};
  // Require route r to be used before route r+1; removes permuted duplicates.
  bool break_route_symmetry { true };
  SolverOptions solver {};
};

} // namespace depotroute::core
