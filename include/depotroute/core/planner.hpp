/* Planner façade: one synchronous validate -> build -> solve -> extract run. */
#pragma once

#include <utility>

#include "depotroute/core/location_graph.hpp"
#include "depotroute/core/options.hpp"
#include "depotroute/core/solution.hpp"
#include "depotroute/core/solver.hpp"

namespace depotroute::core {

// Planner holds only the solving capability; every run is a pure function of
// (graph, options, solver) and leaves no state behind.
class Planner {
public:
  explicit Planner(SolverPtr solver) : solver_(std::move(solver)) {}

  [[nodiscard]] const SolverPtr& solver() const noexcept { return solver_; }

  // Throws ValidationError, InfeasibleModel, SolverTimeout (limit reached
  // without any incumbent), SolverError or ReconstructionError. A limit
  // reached with an incumbent returns normally with
  // status == SolveStatus::TimeLimitReached; an incumbent the backend stopped
  // on for other reasons comes back as SolveStatus::Feasible.
  [[nodiscard]] PlanResult plan(const LocationGraph& g, const PlanOptions& opts) const;

  // Interrupts a plan() running on another thread. That run then behaves as
  // if its time limit expired. Returns false if nothing could be interrupted.
  bool cancel() const;

private:
  SolverPtr solver_;
};

// Convenience wrapper over Planner with the OR-tools adapter.
[[nodiscard]] PlanResult plan_routes(const LocationGraph& g, const PlanOptions& opts);

} // namespace depotroute::core
