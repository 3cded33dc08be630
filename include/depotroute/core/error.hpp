#pragma once

#include <stdexcept>
#include <string>

namespace depotroute::core {

// Malformed or incomplete tables/options. Raised before any model is built.
struct ValidationError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Overrides or the time budget admit no assignment.
struct InfeasibleModel : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Wall-clock limit expired before any incumbent was found.
struct SolverTimeout : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

// The solving capability failed (backend missing, invalid model, abnormal stop).
struct SolverError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Selected arcs do not form simple start->end paths. Always a modeling defect.
struct ReconstructionError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

} // namespace depotroute::core
