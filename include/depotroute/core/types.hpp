/* Core type aliases and helper enums.
 *
 * For Python developers:
 * - NodeId: int32 index of a location inside a LocationGraph
 * - VarId/RowId: int32 index of a variable/row inside a MipModel
 * - Minutes/Money: double (matches float)
 * - std::optional<T>: nullable value (like T | None)
 */
#pragma once

#include <cstdint>
#include <string>

namespace depotroute::core {

// Location and model identifiers are signed 32-bit integers; -1 means "absent".
using NodeId = std::int32_t;
using VarId  = std::int32_t;
using RowId  = std::int32_t;
using RouteId = std::int32_t;

using Minutes = double;  // Drive time, always normalized to minutes
using Miles   = double;  // Drive distance
using Money   = double;  // Any cost figure

inline constexpr NodeId kNoNode = -1;
inline constexpr VarId kNoVar = -1;

enum class LocationRole {
  Hub = 1,    // Origin/destination every route returns to by default
  Depot = 2   // Collection point: visited by a route or ships directly
};

// Operator override applied before solving.
enum class FixedDecision {
  Unconstrained = 0,
  ForceDirect = 1,   // Must ship directly; never visited by a route
  ForceRoute = 2     // Must be visited by exactly one route
};

enum class CostModel {
  Flat = 1,      // cost_per_minute * drive time per arc
  Itemized = 2   // gas per mile * distance + staff per hour * time / 60
};

// Outcome of a solve as seen by callers. Construction failures and solver
// breakdowns are reported as exceptions, not as a status.
enum class SolveStatus {
  Optimal = 1,
  TimeLimitReached = 2,  // Best incumbent at the wall-clock limit or on cancel, possibly suboptimal
  Infeasible = 3,
  Feasible = 4           // Incumbent from a search the backend ended early on its own (e.g. gap limit)
};

[[nodiscard]] inline std::string to_string(SolveStatus s) {
  switch (s) {
    case SolveStatus::Optimal: return "optimal";
    case SolveStatus::TimeLimitReached: return "time-limit-reached";
    case SolveStatus::Infeasible: return "infeasible";
    case SolveStatus::Feasible: return "feasible";
  }
  return "unknown";
}

} // namespace depotroute::core
