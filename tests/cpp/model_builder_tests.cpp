#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "depotroute/core/error.hpp"
#include "depotroute/core/model_builder.hpp"
#include "test_utils.hpp"

using namespace depotroute::core;
using namespace depotroute::core::test;

namespace {

bool has_row(const RoutingModel& m, const std::string& name) {
  for (const auto& row : m.mip.rows()) {
    if (row.name == name) return true;
  }
  return false;
}

const MipRow& row_named(const RoutingModel& m, const std::string& name) {
  for (const auto& row : m.mip.rows()) {
    if (row.name == name) return row;
  }
  throw std::out_of_range("no row " + name);
}

} // namespace

TEST(ModelBuilder, SingleRouteShape) {
  auto g = make_scenario_graph();
  auto m = build_routing_model(g, make_scenario_options(60.0));

  EXPECT_EQ(m.num_routes, 1);
  EXPECT_EQ(m.start, g.hub());
  EXPECT_EQ(m.end, g.hub());
  ASSERT_EQ(m.covered.size(), 2u);
  // direct(2) + used(1) + arcs(3*2) + positions(2)
  EXPECT_EQ(m.mip.num_vars(), 11);
  // cover(2) + balance(2) + leave/reach(2) + budget(1) + order(2)
  EXPECT_EQ(m.mip.num_rows(), 9);
  EXPECT_FALSE(has_row(m, "route_cap"));
  EXPECT_EQ(m.direct_var(g.hub()), kNoVar);
}

TEST(ModelBuilder, MultiRouteAddsCapAndSymmetryRows) {
  auto g = make_scenario_graph();
  auto opts = make_scenario_options(60.0);
  opts.max_routes = 2;
  auto m = build_routing_model(g, opts);
  EXPECT_EQ(m.mip.num_vars(), 2 + 2 * 9);
  EXPECT_EQ(m.mip.num_rows(), 2 + 2 * 7 + 1 + 1);
  ASSERT_TRUE(has_row(m, "route_cap"));
  EXPECT_DOUBLE_EQ(row_named(m, "route_cap").upper, 2.0);
  EXPECT_TRUE(has_row(m, "route_order_1"));

  opts.break_route_symmetry = false;
  auto loose = build_routing_model(g, opts);
  EXPECT_FALSE(has_row(loose, "route_order_1"));
}

TEST(ModelBuilder, PositionsBoundedByCoveredCount) {
  auto g = make_scenario_graph();
  auto m = build_routing_model(g, make_scenario_options(60.0));
  for (NodeId n : m.covered) {
    const auto& v = m.mip.vars()[static_cast<std::size_t>(m.position_var(0, n))];
    EXPECT_DOUBLE_EQ(v.lower, 1.0);
    EXPECT_DOUBLE_EQ(v.upper, 2.0);
    EXPECT_TRUE(v.integer);
  }
}

TEST(ModelBuilder, BudgetRowCarriesArcTimes) {
  auto g = make_scenario_graph();
  auto m = build_routing_model(g, make_scenario_options(45.0));
  const auto& budget = row_named(m, "budget_0");
  EXPECT_DOUBLE_EQ(budget.upper, 45.0);
  EXPECT_EQ(budget.terms.size(), 6u);
  const VarId ab = m.arc_var(0, g.index_of("A"), g.index_of("B"));
  bool found = false;
  for (const auto& t : budget.terms) {
    if (t.var == ab) { EXPECT_DOUBLE_EQ(t.coef, 15.0); found = true; }
  }
  EXPECT_TRUE(found);
}

TEST(ModelBuilder, ForceDirectIsEqualityRowNotDeletion) {
  auto g = make_scenario_graph(FixedDecision::ForceDirect);
  auto m = build_routing_model(g, make_scenario_options(60.0));
  const NodeId a = g.index_of("A");
  // Variables still exist
  EXPECT_NE(m.direct_var(a), kNoVar);
  EXPECT_NE(m.arc_var(0, g.hub(), a), kNoVar);
  const auto& fix = row_named(m, "fix_direct_A");
  EXPECT_DOUBLE_EQ(fix.lower, 1.0);
  EXPECT_DOUBLE_EQ(fix.upper, 1.0);
  const auto& off = row_named(m, "off_route_0_A");
  EXPECT_DOUBLE_EQ(off.upper, 0.0);
  EXPECT_EQ(off.terms.size(), 4u);  // H->A, B->A, A->H, A->B
}

TEST(ModelBuilder, ForceRoutePinsDirectToZero) {
  auto g = make_scenario_graph(FixedDecision::Unconstrained, FixedDecision::ForceRoute);
  auto m = build_routing_model(g, make_scenario_options(60.0));
  const auto& fix = row_named(m, "fix_route_B");
  EXPECT_DOUBLE_EQ(fix.lower, 0.0);
  EXPECT_DOUBLE_EQ(fix.upper, 0.0);
}

TEST(ModelBuilder, ExcludedLocationsLeaveTheModel) {
  std::vector<Location> locs{hub("H"), depot("A", 1.0), depot("X", 1.0, FixedDecision::Unconstrained, false)};
  std::vector<Edge> edges{{"H", "A", 1.0, std::nullopt}};
  auto g = LocationGraph::from_tables(locs, edges, true);
  PlanOptions opts;
  opts.max_drive_time = 10.0;
  auto m = build_routing_model(g, opts);
  ASSERT_EQ(m.covered.size(), 1u);
  EXPECT_EQ(m.covered.front(), g.index_of("A"));
  EXPECT_EQ(m.direct_var(g.index_of("X")), kNoVar);
}

TEST(ModelBuilder, ExcludedButForcedRouteStaysWithArcsDisabled) {
  std::vector<Location> locs{hub("H"), depot("A", 1.0), depot("X", 1.0, FixedDecision::ForceRoute, false)};
  std::vector<Edge> edges{{"H", "A", 1.0, std::nullopt}};
  auto g = LocationGraph::from_tables(locs, edges, true);
  PlanOptions opts;
  opts.max_drive_time = 10.0;
  auto m = build_routing_model(g, opts);
  EXPECT_EQ(m.covered.size(), 2u);
  EXPECT_TRUE(has_row(m, "fix_route_X"));
  EXPECT_TRUE(has_row(m, "off_route_0_X"));
}

TEST(ModelBuilder, ForceDirectAnchorIsInfeasible) {
  auto g = make_scenario_graph(FixedDecision::Unconstrained, FixedDecision::ForceDirect);
  auto opts = make_scenario_options(60.0);
  opts.end = "B";
  EXPECT_THROW((void)build_routing_model(g, opts), InfeasibleModel);
}

TEST(ModelBuilder, HubOverrideOffTheRouteIsInfeasible) {
  for (auto fixed : {FixedDecision::ForceDirect, FixedDecision::ForceRoute}) {
    auto h = hub("H");
    h.fixed = fixed;
    std::vector<Location> locs{h, depot("A", 100.0), depot("B", 150.0)};
    std::vector<Edge> edges{{"H", "A", 20.0, std::nullopt}, {"H", "B", 25.0, std::nullopt},
                            {"A", "B", 15.0, std::nullopt}};
    auto g = LocationGraph::from_tables(locs, edges, true);
    auto opts = make_scenario_options(60.0);
    opts.start = "A";
    opts.end = "A";
    EXPECT_THROW((void)build_routing_model(g, opts), InfeasibleModel);
  }
}

TEST(ModelBuilder, HubAnchorIgnoresForceRoute) {
  auto h = hub("H");
  h.fixed = FixedDecision::ForceRoute;
  std::vector<Location> locs{h, depot("A", 100.0), depot("B", 150.0)};
  std::vector<Edge> edges{{"H", "A", 20.0, std::nullopt}, {"H", "B", 25.0, std::nullopt},
                          {"A", "B", 15.0, std::nullopt}};
  auto g = LocationGraph::from_tables(locs, edges, true);
  auto m = build_routing_model(g, make_scenario_options(60.0));
  EXPECT_EQ(m.start, g.hub());
  EXPECT_EQ(m.covered.size(), 2u);
}

TEST(ModelBuilder, OpenRouteHasNoArcsIntoStartOrOutOfEnd) {
  auto g = make_scenario_graph();
  auto opts = make_scenario_options(60.0);
  opts.end = "B";
  auto m = build_routing_model(g, opts);
  const NodeId h = g.index_of("H"), a = g.index_of("A"), b = g.index_of("B");
  ASSERT_EQ(m.covered.size(), 1u);
  EXPECT_EQ(m.arc_var(0, a, h), kNoVar);
  EXPECT_EQ(m.arc_var(0, b, a), kNoVar);
  EXPECT_EQ(m.arc_var(0, h, b), kNoVar);
  EXPECT_NE(m.arc_var(0, h, a), kNoVar);
  EXPECT_NE(m.arc_var(0, a, b), kNoVar);
}

TEST(ModelBuilder, HandBuiltTourSatisfiesModel) {
  auto g = make_scenario_graph();
  auto m = build_routing_model(g, make_scenario_options(60.0));
  auto values = zero_assignment(m);
  set_route(values, m, g, 0, {"H", "A", "B", "H"});
  EXPECT_TRUE(m.mip.is_satisfied_by(values));
}

TEST(ModelBuilder, OverBudgetTourViolatesModel) {
  auto g = make_scenario_graph();
  auto m = build_routing_model(g, make_scenario_options(59.0));
  auto values = zero_assignment(m);
  set_route(values, m, g, 0, {"H", "A", "B", "H"});
  EXPECT_FALSE(m.mip.is_satisfied_by(values));
}

TEST(ModelBuilder, DisjointCycleViolatesSequencing) {
  auto g = make_plane_graph({{10, 0}, {20, 0}, {0, 10}}, {50, 50, 50});
  PlanOptions opts;
  opts.max_drive_time = 1000.0;
  auto m = build_routing_model(g, opts);
  auto values = zero_assignment(m);
  // H -> D0 -> H plus a detached D1 <-> D2 loop
  set_route(values, m, g, 0, {"H", "D0", "H"});
  values[static_cast<std::size_t>(m.arc_var(0, g.index_of("D1"), g.index_of("D2")))] = 1.0;
  values[static_cast<std::size_t>(m.arc_var(0, g.index_of("D2"), g.index_of("D1")))] = 1.0;
  fill_idle_positions(values, m);
  EXPECT_FALSE(m.mip.is_satisfied_by(values));
}

TEST(ModelBuilder, AllDirectAssignmentIsFeasible) {
  auto g = make_scenario_graph();
  auto m = build_routing_model(g, make_scenario_options(0.0));
  auto values = zero_assignment(m);
  set_direct(values, m, g, "A");
  set_direct(values, m, g, "B");
  fill_idle_positions(values, m);
  EXPECT_TRUE(m.mip.is_satisfied_by(values));
}
