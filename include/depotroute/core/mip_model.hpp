/* Solver-neutral mixed-integer linear model: variables, ranged rows, objective. */
#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "depotroute/core/types.hpp"

namespace depotroute::core {

inline constexpr double kInfinity = std::numeric_limits<double>::infinity();

struct MipVariable {
  double lower { 0.0 };
  double upper { 1.0 };
  bool integer { true };
  std::string name;
};

struct LinearTerm {
  VarId var { kNoVar };
  double coef { 0.0 };
};

// Ranged row: lower <= sum(coef * var) <= upper. Equality rows use lower == upper.
struct MipRow {
  std::vector<LinearTerm> terms;
  double lower { -kInfinity };
  double upper { kInfinity };
  std::string name;
};

// MipModel is an append-only description of a minimization problem. It owns
// no solver state; a MipSolver translates it for a concrete engine.
class MipModel {
public:
  VarId add_binary(std::string name);
  VarId add_integer(double lower, double upper, std::string name);

  RowId add_row(std::vector<LinearTerm> terms, double lower, double upper, std::string name);
  RowId add_equal(std::vector<LinearTerm> terms, double rhs, std::string name) {
    return add_row(std::move(terms), rhs, rhs, std::move(name));
  }
  RowId add_less_equal(std::vector<LinearTerm> terms, double rhs, std::string name) {
    return add_row(std::move(terms), -kInfinity, rhs, std::move(name));
  }

  // Objective coefficients accumulate; unset variables have coefficient 0.
  void add_objective(VarId v, double coef);

  [[nodiscard]] std::int32_t num_vars() const noexcept { return static_cast<std::int32_t>(vars_.size()); }
  [[nodiscard]] std::int32_t num_rows() const noexcept { return static_cast<std::int32_t>(rows_.size()); }
  [[nodiscard]] const std::vector<MipVariable>& vars() const noexcept { return vars_; }
  [[nodiscard]] const std::vector<MipRow>& rows() const noexcept { return rows_; }
  [[nodiscard]] const std::vector<double>& objective() const noexcept { return objective_; }

  // Evaluate the objective and check every row/bound against an assignment.
  [[nodiscard]] double objective_value(const std::vector<double>& values) const;
  [[nodiscard]] bool is_satisfied_by(const std::vector<double>& values, double tol = 1e-6) const;

private:
  std::vector<MipVariable> vars_ {};
  std::vector<MipRow> rows_ {};
  std::vector<double> objective_ {};
};

} // namespace depotroute::core
