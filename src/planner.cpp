/*
  Planner — maps solver statuses onto the error model and stitches the
  builder, objective composer, solver adapter and extractor together.
*/
#include "depotroute/core/planner.hpp"
#include "depotroute/core/error.hpp"
#include "depotroute/core/model_builder.hpp"
#include "depotroute/core/objective.hpp"

#include <stdexcept>

#include "absl/log/log.h"
#include "absl/strings/str_cat.h"

namespace depotroute::core {

PlanResult Planner::plan(const LocationGraph& g, const PlanOptions& opts) const {
  if (!solver_) {
    throw std::invalid_argument("Planner: solver must not be null");
  }
  RoutingModel model = build_routing_model(g, opts);
  const ObjectiveCoefficients coefs = compose_objective(g, opts.cost);
  apply_objective(model, coefs);

  SolverOutcome outcome = solver_->solve(model.mip, opts.solver);
  LOG(INFO) << solver_->name() << " finished: " << to_string(outcome.status);

  switch (outcome.status) {
    case SolveStatus::Infeasible:
      throw InfeasibleModel(absl::StrCat("no assignment satisfies the overrides and a drive-time budget of ",
                                         opts.max_drive_time, " minutes"));
    case SolveStatus::TimeLimitReached:
      if (!outcome.has_assignment()) {
        throw SolverTimeout("time limit reached before any feasible assignment was found");
      }
      LOG(WARNING) << "time limit reached; returning best incumbent with objective " << outcome.objective;
      break;
    case SolveStatus::Optimal:
    case SolveStatus::Feasible:
      if (!outcome.has_assignment()) {
        throw SolverError(absl::StrCat(solver_->name(), " reported ", to_string(outcome.status),
                                       " without an assignment"));
      }
      break;
  }
  return extract_solution(g, model, coefs, opts, outcome);
}

bool Planner::cancel() const {
  if (!solver_) return false;
  const bool stopped = solver_->interrupt();
  LOG(INFO) << "cancel requested on " << solver_->name() << (stopped ? "" : " (nothing to interrupt)");
  return stopped;
}

PlanResult plan_routes(const LocationGraph& g, const PlanOptions& opts) {
  return Planner(make_ortools_solver()).plan(g, opts);
}

} // namespace depotroute::core
