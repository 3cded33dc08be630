#pragma once

#include <gtest/gtest.h>
#include <cmath>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include "depotroute/core/location_graph.hpp"
#include "depotroute/core/model_builder.hpp"
#include "depotroute/core/options.hpp"
#include "depotroute/core/solution.hpp"
#include "depotroute/core/solver.hpp"

namespace depotroute::core::test {

inline Location hub(const std::string& id) {
  return Location{id, LocationRole::Hub, true, 0.0, FixedDecision::Unconstrained};
}

inline Location depot(const std::string& id, Money direct_cost,
                      FixedDecision fixed = FixedDecision::Unconstrained, bool included = true) {
  return Location{id, LocationRole::Depot, included, direct_cost, fixed};
}

// Scenario graph: hub H, depots A (direct 100) and B (direct 150);
// H-A 20, H-B 25, A-B 15 minutes, mirrored. Distances are 10, 12, 6 miles.
inline LocationGraph make_scenario_graph(FixedDecision fixed_a = FixedDecision::Unconstrained,
                                         FixedDecision fixed_b = FixedDecision::Unconstrained) {
  std::vector<Location> locs{hub("H"), depot("A", 100.0, fixed_a), depot("B", 150.0, fixed_b)};
  std::vector<Edge> edges{
      {"H", "A", 20.0, 10.0},
      {"H", "B", 25.0, 12.0},
      {"A", "B", 15.0, 6.0},
  };
  return LocationGraph::from_tables(locs, edges, /*mirror=*/true);
}

// Scenario options: single route, flat 2 per minute, given budget.
inline PlanOptions make_scenario_options(Minutes budget) {
  PlanOptions opts;
  opts.max_drive_time = budget;
  opts.max_routes = 1;
  opts.cost.model = CostModel::Flat;
  opts.cost.cost_per_minute = 2.0;
  return opts;
}

// Depots on a plane around a hub at the origin; times are rounded Euclidean
// distances, mirrored. Depot i has direct cost direct_costs[i].
inline LocationGraph make_plane_graph(const std::vector<std::pair<double, double>>& coords,
                                      const std::vector<Money>& direct_costs) {
  std::vector<Location> locs{hub("H")};
  std::vector<std::pair<double, double>> pts{{0.0, 0.0}};
  for (std::size_t i = 0; i < coords.size(); ++i) {
    locs.push_back(depot("D" + std::to_string(i), direct_costs[i]));
    pts.push_back(coords[i]);
  }
  std::vector<Edge> edges;
  for (std::size_t a = 0; a < pts.size(); ++a) {
    for (std::size_t b = a + 1; b < pts.size(); ++b) {
      const double dx = pts[a].first - pts[b].first;
      const double dy = pts[a].second - pts[b].second;
      const double d = std::round(std::sqrt(dx * dx + dy * dy));
      edges.push_back(Edge{locs[a].id, locs[b].id, d, d});
    }
  }
  return LocationGraph::from_tables(locs, edges, /*mirror=*/true);
}

// Solver stub returning a canned outcome and recording how often it ran or
// was asked to stop.
class FakeSolver final : public MipSolver {
public:
  explicit FakeSolver(SolverOutcome outcome) : outcome_(std::move(outcome)) {}
  std::string name() const override { return "fake"; }
  SolverOutcome solve(const MipModel&, const SolverOptions&) override {
    ++calls;
    return outcome_;
  }
  bool interrupt() override {
    ++interrupts;
    return interruptible;
  }
  int calls {0};
  int interrupts {0};
  bool interruptible {true};

private:
  SolverOutcome outcome_;
};

// Assignment helpers over a built model
inline std::vector<double> zero_assignment(const RoutingModel& m) {
  return std::vector<double>(static_cast<std::size_t>(m.mip.num_vars()), 0.0);
}

inline void set_direct(std::vector<double>& values, const RoutingModel& m, const LocationGraph& g,
                       const std::string& id) {
  values[static_cast<std::size_t>(m.direct_var(g.index_of(id)))] = 1.0;
}

// Marks route r as driving the given sequence (anchors included) and fills
// consistent sequencing positions.
inline void set_route(std::vector<double>& values, const RoutingModel& m, const LocationGraph& g,
                      RouteId r, const std::vector<std::string>& seq) {
  values[static_cast<std::size_t>(m.route_used_var(r))] = 1.0;
  for (std::size_t i = 0; i + 1 < seq.size(); ++i) {
    VarId v = m.arc_var(r, g.index_of(seq[i]), g.index_of(seq[i + 1]));
    ASSERT_NE(v, kNoVar) << "no arc " << seq[i] << "->" << seq[i + 1];
    values[static_cast<std::size_t>(v)] = 1.0;
  }
  for (std::size_t i = 1; i + 1 < seq.size(); ++i) {
    VarId p = m.position_var(r, g.index_of(seq[i]));
    ASSERT_NE(p, kNoVar);
    values[static_cast<std::size_t>(p)] = static_cast<double>(i);
  }
}

// Positions of covered locations not on any route still need a value in range.
inline void fill_idle_positions(std::vector<double>& values, const RoutingModel& m) {
  for (auto p : m.position) {
    if (p != kNoVar && values[static_cast<std::size_t>(p)] < 1.0) values[static_cast<std::size_t>(p)] = 1.0;
  }
}

// Property checks shared by end-to-end tests
inline void expect_plan_consistent(const LocationGraph& g, const PlanOptions& opts, const PlanResult& res) {
  const NodeId start = g.start_of(opts);
  const NodeId end = g.end_of(opts);
  std::multiset<std::string> seen;
  for (const auto& d : res.direct) seen.insert(d.location);
  for (const auto& route : res.routes) {
    ASSERT_GE(route.stops.size(), 3u) << "route must visit at least one location";
    EXPECT_EQ(route.stops.front().location, g.location(start).id);
    EXPECT_EQ(route.stops.back().location, g.location(end).id);
    std::set<std::string> on_this_route;
    Minutes sum = 0.0;
    for (std::size_t i = 1; i < route.stops.size(); ++i) {
      sum += g.time(route.stops[i - 1].location, route.stops[i].location);
      EXPECT_NEAR(route.stops[i].cumulative_time, sum, 1e-9);
    }
    EXPECT_NEAR(route.total_time, sum, 1e-9);
    EXPECT_LE(route.total_time, opts.max_drive_time);
    for (const auto& v : route.visited()) {
      EXPECT_TRUE(on_this_route.insert(v).second) << "repeated stop " << v;
      seen.insert(v);
    }
  }
  for (NodeId n = 0; n < g.num_locations(); ++n) {
    const auto& loc = g.location(n);
    if (n == g.hub() || n == start || n == end) continue;
    if (!loc.included) {
      EXPECT_EQ(seen.count(loc.id), 0u) << "excluded location " << loc.id << " appears in plan";
      continue;
    }
    EXPECT_EQ(seen.count(loc.id), 1u) << "location " << loc.id << " not covered exactly once";
  }
  Money direct = 0.0;
  for (const auto& d : res.direct) direct += d.cost;
  Money routes = 0.0;
  for (const auto& r : res.routes) routes += r.total_cost;
  EXPECT_NEAR(res.direct_cost, direct, 1e-9);
  EXPECT_NEAR(res.route_cost, routes, 1e-9);
  EXPECT_NEAR(res.total_cost, direct + routes, 1e-9);
  EXPECT_NEAR(res.objective_value, res.total_cost, 1e-4);
}

inline std::set<std::string> visited_set(const Route& r) {
  auto v = r.visited();
  return {v.begin(), v.end()};
}

} // namespace depotroute::core::test
