/*
  MipModel — append-only MILP description shared by the model builder and
  solver adapters.
*/
#include "depotroute/core/mip_model.hpp"

#include <cmath>
#include <stdexcept>

namespace depotroute::core {

VarId MipModel::add_binary(std::string name) {
  return add_integer(0.0, 1.0, std::move(name));
}

VarId MipModel::add_integer(double lower, double upper, std::string name) {
  if (lower > upper) {
    throw std::invalid_argument("variable '" + name + "': lower bound exceeds upper bound");
  }
  vars_.push_back(MipVariable{lower, upper, true, std::move(name)});
  objective_.push_back(0.0);
  return static_cast<VarId>(vars_.size() - 1);
}

RowId MipModel::add_row(std::vector<LinearTerm> terms, double lower, double upper, std::string name) {
  for (const auto& t : terms) {
    if (t.var < 0 || t.var >= num_vars()) {
      throw std::out_of_range("row '" + name + "' references an unknown variable");
    }
  }
  rows_.push_back(MipRow{std::move(terms), lower, upper, std::move(name)});
  return static_cast<RowId>(rows_.size() - 1);
}

void MipModel::add_objective(VarId v, double coef) {
  if (v < 0 || v >= num_vars()) {
    throw std::out_of_range("objective references an unknown variable");
  }
  objective_[static_cast<std::size_t>(v)] += coef;
}

double MipModel::objective_value(const std::vector<double>& values) const {
  double total = 0.0;
  for (std::size_t i = 0; i < objective_.size() && i < values.size(); ++i) {
    total += objective_[i] * values[i];
  }
  return total;
}

bool MipModel::is_satisfied_by(const std::vector<double>& values, double tol) const {
  if (values.size() != vars_.size()) return false;
  for (std::size_t i = 0; i < vars_.size(); ++i) {
    const auto& v = vars_[i];
    if (values[i] < v.lower - tol || values[i] > v.upper + tol) return false;
    if (v.integer && std::abs(values[i] - std::round(values[i])) > tol) return false;
  }
  for (const auto& row : rows_) {
    double lhs = 0.0;
    for (const auto& t : row.terms) lhs += t.coef * values[static_cast<std::size_t>(t.var)];
    if (lhs < row.lower - tol || lhs > row.upper + tol) return false;
  }
  return true;
}

} // namespace depotroute::core
