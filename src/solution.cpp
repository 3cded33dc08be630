/*
  extract_solution — turns a solver assignment into direct shipments and
  ordered routes.

  Each used route is walked from start by following its single selected
  out-arc until the end anchor is reached. A visited mask turns an unexpected
  cycle into a ReconstructionError instead of an endless walk, and comparing
  the walked arc count with the selected arc count detects cycles disjoint
  from the anchors.
*/
#include "depotroute/core/solution.hpp"
#include "depotroute/core/error.hpp"

#include <cstdint>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/strings/str_cat.h"

namespace depotroute::core {

namespace {

// Binary variables are read with a midpoint threshold.
constexpr double kSelected = 0.5;

} // namespace

std::vector<std::string> Route::visited() const {
  std::vector<std::string> out;
  if (stops.size() < 2) return out;
  for (std::size_t i = 1; i + 1 < stops.size(); ++i) out.push_back(stops[i].location);
  return out;
}

PlanResult extract_solution(const LocationGraph& g,
                            const RoutingModel& m,
                            const ObjectiveCoefficients& coefs,
                            const PlanOptions& opts,
                            const SolverOutcome& outcome) {
  if (outcome.values.size() != static_cast<std::size_t>(m.mip.num_vars())) {
    throw ReconstructionError(absl::StrCat("assignment has ", outcome.values.size(),
                                           " values for ", m.mip.num_vars(), " variables"));
  }
  auto selected = [&](VarId v) {
    return v != kNoVar && outcome.values[static_cast<std::size_t>(v)] > kSelected;
  };
  auto id = [&](NodeId n) -> const std::string& { return g.location(n).id; };

  PlanResult res;
  res.status = outcome.status;
  res.objective_value = outcome.objective;

  const auto N = static_cast<std::size_t>(m.num_nodes);
  std::vector<int> times_covered(N, 0);
  std::vector<std::uint8_t> on_route(N, 0);

  for (NodeId n : m.covered) {
    if (!selected(m.direct_var(n))) continue;
    const Money c = coefs.direct_cost[static_cast<std::size_t>(n)];
    res.direct.push_back(DirectShipment{id(n), c});
    res.direct_cost += c;
    times_covered[static_cast<std::size_t>(n)]++;
  }

  for (RouteId r = 0; r < m.num_routes; ++r) {
    // Successor lists for this route (like a defaultdict(list))
    std::vector<std::vector<NodeId>> succ(N);
    std::size_t arcs_selected = 0;
    for (NodeId a = 0; a < m.num_nodes; ++a) {
      for (NodeId b = 0; b < m.num_nodes; ++b) {
        if (!selected(m.arc_var(r, a, b))) continue;
        succ[static_cast<std::size_t>(a)].push_back(b);
        ++arcs_selected;
      }
    }

    if (!selected(m.route_used_var(r))) {
      if (arcs_selected != 0) {
        throw ReconstructionError(absl::StrCat("route ", r, " is unused but selects ", arcs_selected, " arcs"));
      }
      continue;
    }

    Route route;
    route.stops.push_back(RouteStop{id(m.start)});
    std::vector<std::uint8_t> visited(N, 0);
    NodeId cur = m.start;
    std::size_t steps = 0;
    while (true) {
      const auto& next = succ[static_cast<std::size_t>(cur)];
      if (next.size() != 1) {
        throw ReconstructionError(absl::StrCat("route ", r, ": location '", id(cur), "' has ",
                                               next.size(), " selected out-arcs"));
      }
      const NodeId nxt = next.front();
      if (!g.has_edge(cur, nxt) || !coefs.has_cost(cur, nxt)) {
        throw ReconstructionError(absl::StrCat("route ", r, " uses undefined arc ", id(cur), "->", id(nxt)));
      }
      const Minutes t = g.time(cur, nxt);
      const Money c = coefs.cost(cur, nxt);
      route.total_time += t;
      route.total_cost += c;
      route.stops.push_back(RouteStop{id(nxt), t, c, route.total_time, route.total_cost});
      if (++steps > N) {
        throw ReconstructionError(absl::StrCat("route ", r, " does not terminate"));
      }
      if (nxt == m.end) break;
      if (visited[static_cast<std::size_t>(nxt)]) {
        throw ReconstructionError(absl::StrCat("route ", r, " revisits '", id(nxt), "'"));
      }
      if (m.direct_var(nxt) == kNoVar) {
        throw ReconstructionError(absl::StrCat("route ", r, " visits uncovered location '", id(nxt), "'"));
      }
      visited[static_cast<std::size_t>(nxt)] = 1;
      on_route[static_cast<std::size_t>(nxt)] = 1;
      times_covered[static_cast<std::size_t>(nxt)]++;
      cur = nxt;
    }

    if (steps != arcs_selected) {
      throw ReconstructionError(absl::StrCat("route ", r, " selects ", arcs_selected,
                                             " arcs but its path has ", steps, " (disjoint cycle)"));
    }
    // Summed leg times are compared exactly; any excess is rejected.
    if (route.total_time > opts.max_drive_time) {
      throw ReconstructionError(absl::StrCat("route ", r, " drives ", route.total_time,
                                             " minutes, over the budget of ", opts.max_drive_time));
    }
    res.route_cost += route.total_cost;
    res.routes.push_back(std::move(route));
  }

  for (NodeId n : m.covered) {
    const auto k = times_covered[static_cast<std::size_t>(n)];
    if (k != 1) {
      throw ReconstructionError(absl::StrCat("location '", id(n), "' is covered ", k, " times"));
    }
    const auto fixed = g.location(n).fixed;
    const bool routed = on_route[static_cast<std::size_t>(n)] != 0;
    if ((fixed == FixedDecision::ForceDirect && routed) || (fixed == FixedDecision::ForceRoute && !routed)) {
      throw ReconstructionError(absl::StrCat("override on '", id(n), "' is not honored by the assignment"));
    }
  }

  res.total_cost = res.direct_cost + res.route_cost;
  VLOG(1) << "extracted " << res.routes.size() << " routes, " << res.direct.size()
          << " direct shipments, total cost " << res.total_cost;
  return res;
}

} // namespace depotroute::core
