/*
  OR-tools backend — thin adapter that translates a MipModel into an
  operations_research::MPSolver and maps its result status.
*/
#include "depotroute/core/solver.hpp"
#include "depotroute/core/error.hpp"

#include <cmath>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/time/time.h"
#include "ortools/linear_solver/linear_solver.h"

namespace depotroute::core {

namespace {

using operations_research::MPConstraint;
using operations_research::MPObjective;
using operations_research::MPSolver;
using operations_research::MPVariable;

double to_mp_bound(double v) {
  if (std::isinf(v)) return v > 0 ? MPSolver::infinity() : -MPSolver::infinity();
  return v;
}

class OrToolsSolver final : public MipSolver {
public:
  std::string name() const override { return "ortools"; }

  bool interrupt() override {
    std::lock_guard<std::mutex> lock(mu_);
    if (active_ == nullptr) return false;
    // CBC has no interrupt hook; SCIP, Gurobi and CP-SAT do.
    if (!active_->InterruptSolve()) return false;
    interrupted_ = true;
    return true;
  }

  SolverOutcome solve(const MipModel& model, const SolverOptions& opts) override {
    std::unique_ptr<MPSolver> solver(MPSolver::CreateSolver(opts.backend));
    if (!solver) {
      throw SolverError(absl::StrCat("MPSolver backend '", opts.backend, "' is not available"));
    }

    std::vector<MPVariable*> vars;
    vars.reserve(model.vars().size());
    for (const auto& v : model.vars()) {
      vars.push_back(solver->MakeVar(to_mp_bound(v.lower), to_mp_bound(v.upper), v.integer, v.name));
    }
    for (const auto& row : model.rows()) {
      MPConstraint* c = solver->MakeRowConstraint(to_mp_bound(row.lower), to_mp_bound(row.upper), row.name);
      // SetCoefficient overwrites; accumulate repeated variables first.
      for (const auto& t : row.terms) {
        auto* var = vars[static_cast<std::size_t>(t.var)];
        c->SetCoefficient(var, c->GetCoefficient(var) + t.coef);
      }
    }
    MPObjective* obj = solver->MutableObjective();
    const auto& coefs = model.objective();
    for (std::size_t i = 0; i < coefs.size(); ++i) {
      if (coefs[i] != 0.0) obj->SetCoefficient(vars[i], coefs[i]);
    }
    obj->SetMinimization();

    if (opts.time_limit) {
      solver->SetTimeLimit(absl::Milliseconds(opts.time_limit->count()));
    }
    if (opts.num_threads > 0) {
      absl::Status st = solver->SetNumThreads(opts.num_threads);
      if (!st.ok()) {
        LOG(WARNING) << "backend " << opts.backend << " ignores num_threads: " << st;
      }
    }
    if (opts.enable_output) {
      solver->EnableOutput();
    } else {
      solver->SuppressOutput();
    }

    LOG(INFO) << "solving with " << opts.backend << ": " << model.num_vars() << " vars, "
              << model.num_rows() << " rows";
    MPSolver::ResultStatus status;
    bool interrupted = false;
    {
      ActiveSolve running(*this, solver.get());
      status = solver->Solve();
      interrupted = running.interrupted();
    }

    SolverOutcome out;
    auto collect = [&]() {
      out.values.reserve(vars.size());
      for (const auto* v : vars) out.values.push_back(v->solution_value());
      out.objective = obj->Value();
    };
    switch (status) {
      case MPSolver::OPTIMAL:
        out.status = SolveStatus::Optimal;
        collect();
        return out;
      case MPSolver::FEASIBLE:
        collect();
        if (opts.time_limit || interrupted) {
          out.status = SolveStatus::TimeLimitReached;
        } else {
          LOG(WARNING) << "backend " << opts.backend
                       << " stopped with an unproven incumbent and no time limit set";
          out.status = SolveStatus::Feasible;
        }
        return out;
      case MPSolver::INFEASIBLE:
        out.status = SolveStatus::Infeasible;
        return out;
      case MPSolver::NOT_SOLVED:
        if (opts.time_limit || interrupted) {
          out.status = SolveStatus::TimeLimitReached;
          return out;
        }
        throw SolverError(absl::StrCat("backend ", opts.backend, " stopped without a result"));
      case MPSolver::UNBOUNDED:
        throw SolverError("model is unbounded");
      case MPSolver::ABNORMAL:
        if (interrupted) {
          out.status = SolveStatus::TimeLimitReached;
          return out;
        }
        throw SolverError(absl::StrCat("backend ", opts.backend, " terminated abnormally"));
      case MPSolver::MODEL_INVALID:
        throw SolverError("backend rejected the model as invalid");
    }
    throw SolverError("unrecognized MPSolver result status");
  }

private:
  // Publishes the running MPSolver to interrupt() for the duration of Solve().
  class ActiveSolve {
  public:
    ActiveSolve(OrToolsSolver& owner, MPSolver* solver) : owner_(owner) {
      std::lock_guard<std::mutex> lock(owner_.mu_);
      if (owner_.active_ != nullptr) {
        throw SolverError("OR-tools adapter is already running a solve");
      }
      owner_.active_ = solver;
      owner_.interrupted_ = false;
    }
    ~ActiveSolve() {
      std::lock_guard<std::mutex> lock(owner_.mu_);
      owner_.active_ = nullptr;
    }
    ActiveSolve(const ActiveSolve&) = delete;
    ActiveSolve& operator=(const ActiveSolve&) = delete;

    bool interrupted() const {
      std::lock_guard<std::mutex> lock(owner_.mu_);
      return owner_.interrupted_;
    }

  private:
    OrToolsSolver& owner_;
  };

  std::mutex mu_;
  MPSolver* active_ { nullptr };
  bool interrupted_ { false };
};

} // namespace

SolverPtr make_ortools_solver() {
  return std::make_shared<OrToolsSolver>();
}

} // namespace depotroute::core
