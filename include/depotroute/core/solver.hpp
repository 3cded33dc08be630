/*
  Solver interface — abstracts the MILP search engine behind solve(model).

  The default implementation delegates to OR-tools MPSolver. Constraint
  construction never depends on which engine runs the search.

  For Python developers:
  - std::shared_ptr<T>: reference-counted pointer (like Python object references)
  - virtual ... = 0: pure virtual (must be implemented by subclass, like @abstractmethod)
*/
#pragma once

#include <memory>
#include <string>
#include <vector>

#include "depotroute/core/mip_model.hpp"
#include "depotroute/core/options.hpp"
#include "depotroute/core/types.hpp"

namespace depotroute::core {

// Raw result of one solve. values has one entry per model variable when an
// assignment is available (Optimal, or TimeLimitReached with an incumbent)
// and is empty otherwise.
struct SolverOutcome {
  SolveStatus status { SolveStatus::Infeasible };
  std::vector<double> values {};
  double objective { 0.0 };

  [[nodiscard]] bool has_assignment() const noexcept { return !values.empty(); }
};

class MipSolver {
public:
  virtual ~MipSolver() noexcept = default;

  [[nodiscard]] virtual std::string name() const = 0;

  // Blocking call. Honors opts.time_limit; on expiry returns the best
  // incumbent with status TimeLimitReached. Throws SolverError when the
  // engine itself fails, which is distinct from an infeasible model.
  [[nodiscard]] virtual SolverOutcome solve(const MipModel& model, const SolverOptions& opts) = 0;

  // Asks a solve running on another thread to stop. The interrupted solve
  // returns like an expired time limit: TimeLimitReached, with the incumbent
  // if one exists. Returns false when no solve is running or the engine
  // cannot be interrupted.
  virtual bool interrupt() = 0;
};

using SolverPtr = std::shared_ptr<MipSolver>;

// OR-tools MPSolver adapter. The backend named in SolverOptions is resolved
// per call, so one adapter serves CBC, SCIP or any other linked engine.
[[nodiscard]] SolverPtr make_ortools_solver();

} // namespace depotroute::core
