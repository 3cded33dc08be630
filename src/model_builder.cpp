/*
  build_routing_model — generalized multi-route model with a per-location
  direct-shipment alternative.

  Variables (per route r):
    direct[l]        binary, l covered
    arc[r][a][b]     binary, a != b over anchors + covered locations
    position[r][l]   integer in [1, |covered|], sequencing for subtour elimination
    route_used[r]    binary, equals the out-degree of start on route r

  Overrides are encoded as equality rows, never as removed variables, so a
  conflicting override surfaces as solver infeasibility.
*/
#include "depotroute/core/model_builder.hpp"
#include "depotroute/core/error.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/strings/str_cat.h"

namespace depotroute::core {

namespace {

// Anchors plus covered locations; arcs only exist inside this set.
bool in_model(const RoutingModel& m, const std::vector<std::uint8_t>& is_covered, NodeId n) {
  return n == m.start || n == m.end || is_covered[static_cast<std::size_t>(n)] != 0;
}

// Direction rules shared by all routes. Unlike LocationGraph::is_route_arc
// this admits arcs touching covered-but-unroutable locations; those arcs are
// created and then pinned to zero by override rows.
bool arc_shape_ok(NodeId a, NodeId b, NodeId start, NodeId end) {
  if (a == b) return false;
  if (start != end) {
    if (b == start || a == end) return false;
    if (a == start && b == end) return false;
  }
  return true;
}

} // namespace

RoutingModel build_routing_model(const LocationGraph& g, const PlanOptions& opts) {
  g.validate_for(opts);

  RoutingModel m;
  m.start = g.start_of(opts);
  m.end = g.end_of(opts);
  m.num_routes = opts.max_routes;
  m.num_nodes = g.num_locations();
  const auto N = static_cast<std::size_t>(m.num_nodes);
  const auto R = static_cast<std::size_t>(m.num_routes);
  auto& mip = m.mip;

  for (NodeId anchor : {m.start, m.end}) {
    if (g.location(anchor).fixed == FixedDecision::ForceDirect) {
      throw InfeasibleModel(absl::StrCat("start/end location '", g.location(anchor).id,
                                         "' is forced to direct shipment"));
    }
  }

  // Off the anchors the hub is neither a stop nor a direct shipper, so no
  // override on it can be honored.
  if (const auto& hub = g.location(g.hub());
      g.hub() != m.start && g.hub() != m.end && hub.fixed != FixedDecision::Unconstrained) {
    throw InfeasibleModel(absl::StrCat("hub '", hub.id, "' carries an override but routes are anchored elsewhere"));
  }

  // Covered: every non-hub, non-anchor location that is included, plus
  // excluded locations forced onto a route (kept so the conflict is reported).
  std::vector<std::uint8_t> is_covered(N, 0);
  for (NodeId n = 0; n < m.num_nodes; ++n) {
    if (n == g.hub() || n == m.start || n == m.end) continue;
    const auto& loc = g.location(n);
    if (loc.included || loc.fixed == FixedDecision::ForceRoute) {
      is_covered[static_cast<std::size_t>(n)] = 1;
      m.covered.push_back(n);
    }
  }
  const auto K = static_cast<double>(m.covered.size());

  // Variables
  m.direct.assign(N, kNoVar);
  for (NodeId n : m.covered) {
    m.direct[static_cast<std::size_t>(n)] = mip.add_binary(absl::StrCat("direct_", g.location(n).id));
  }
  m.route_used.assign(R, kNoVar);
  m.arc.assign(R * N * N, kNoVar);
  m.position.assign(R * N, kNoVar);
  for (RouteId r = 0; r < m.num_routes; ++r) {
    m.route_used[static_cast<std::size_t>(r)] = mip.add_binary(absl::StrCat("used_", r));
    for (NodeId a = 0; a < m.num_nodes; ++a) {
      if (!in_model(m, is_covered, a)) continue;
      for (NodeId b = 0; b < m.num_nodes; ++b) {
        if (!in_model(m, is_covered, b) || !arc_shape_ok(a, b, m.start, m.end)) continue;
        const auto idx = (static_cast<std::size_t>(r) * N + static_cast<std::size_t>(a)) * N + static_cast<std::size_t>(b);
        m.arc[idx] = mip.add_binary(absl::StrCat("arc_", r, "_", g.location(a).id, "_", g.location(b).id));
      }
    }
    for (NodeId n : m.covered) {
      m.position[static_cast<std::size_t>(r) * N + static_cast<std::size_t>(n)] =
          mip.add_integer(1.0, K, absl::StrCat("pos_", r, "_", g.location(n).id));
    }
  }

  // Per-route in/out arc lists of a node.
  auto in_arcs = [&](RouteId r, NodeId n) {
    std::vector<LinearTerm> terms;
    for (NodeId a = 0; a < m.num_nodes; ++a) {
      if (VarId v = m.arc_var(r, a, n); v != kNoVar) terms.push_back({v, 1.0});
    }
    return terms;
  };
  auto out_arcs = [&](RouteId r, NodeId n) {
    std::vector<LinearTerm> terms;
    for (NodeId b = 0; b < m.num_nodes; ++b) {
      if (VarId v = m.arc_var(r, n, b); v != kNoVar) terms.push_back({v, 1.0});
    }
    return terms;
  };

  // Coverage: direct[l] + sum_r in_r(l) == 1
  for (NodeId n : m.covered) {
    std::vector<LinearTerm> terms{{m.direct_var(n), 1.0}};
    for (RouteId r = 0; r < m.num_routes; ++r) {
      auto in = in_arcs(r, n);
      terms.insert(terms.end(), in.begin(), in.end());
    }
    mip.add_equal(std::move(terms), 1.0, absl::StrCat("cover_", g.location(n).id));
  }

  for (RouteId r = 0; r < m.num_routes; ++r) {
    const VarId used = m.route_used_var(r);

    // Degree balance: in_r(l) - out_r(l) == 0 (coverage bounds both by 1)
    for (NodeId n : m.covered) {
      auto terms = in_arcs(r, n);
      for (auto t : out_arcs(r, n)) terms.push_back({t.var, -1.0});
      mip.add_equal(std::move(terms), 0.0, absl::StrCat("balance_", r, "_", g.location(n).id));
    }

    // Anchoring: out_r(start) == used_r == in_r(end). With start == end this
    // is a closed tour through the anchor.
    {
      auto terms = out_arcs(r, m.start);
      terms.push_back({used, -1.0});
      mip.add_equal(std::move(terms), 0.0, absl::StrCat("leave_start_", r));
    }
    {
      auto terms = in_arcs(r, m.end);
      terms.push_back({used, -1.0});
      mip.add_equal(std::move(terms), 0.0, absl::StrCat("reach_end_", r));
    }

    // Time budget
    {
      std::vector<LinearTerm> terms;
      for (NodeId a = 0; a < m.num_nodes; ++a) {
        for (NodeId b = 0; b < m.num_nodes; ++b) {
          VarId v = m.arc_var(r, a, b);
          if (v == kNoVar || !g.has_edge(a, b)) continue;
          const Minutes t = g.time(a, b);
          if (t > 0.0) terms.push_back({v, t});
        }
      }
      mip.add_less_equal(std::move(terms), opts.max_drive_time, absl::StrCat("budget_", r));
    }

    // Subtour elimination: arc a->b between covered locations forces
    // pos(b) >= pos(a) + 1, i.e. pos(a) - pos(b) + K * x <= K - 1.
    // Arcs into the end anchor carry no position and are exempt.
    for (NodeId a : m.covered) {
      for (NodeId b : m.covered) {
        VarId x = m.arc_var(r, a, b);
        if (x == kNoVar) continue;
        mip.add_less_equal({{m.position_var(r, a), 1.0}, {m.position_var(r, b), -1.0}, {x, K}},
                           K - 1.0,
                           absl::StrCat("order_", r, "_", g.location(a).id, "_", g.location(b).id));
      }
    }

    // Locations no route may touch on this route: forced direct or excluded.
    for (NodeId n : m.covered) {
      const auto& loc = g.location(n);
      if (loc.fixed != FixedDecision::ForceDirect && loc.included) continue;
      auto terms = in_arcs(r, n);
      auto out = out_arcs(r, n);
      terms.insert(terms.end(), out.begin(), out.end());
      if (terms.empty()) continue;
      mip.add_equal(std::move(terms), 0.0, absl::StrCat("off_route_", r, "_", loc.id));
    }

    if (opts.break_route_symmetry && r > 0) {
      mip.add_less_equal({{used, 1.0}, {m.route_used_var(r - 1), -1.0}}, 0.0,
                         absl::StrCat("route_order_", r));
    }
  }

  // Fixed decisions on the direct-ship indicator
  for (NodeId n : m.covered) {
    const auto& loc = g.location(n);
    if (loc.fixed == FixedDecision::ForceDirect) {
      mip.add_equal({{m.direct_var(n), 1.0}}, 1.0, absl::StrCat("fix_direct_", loc.id));
    } else if (loc.fixed == FixedDecision::ForceRoute) {
      mip.add_equal({{m.direct_var(n), 1.0}}, 0.0, absl::StrCat("fix_route_", loc.id));
    }
  }

  // Route-count cap; implied by the route index range in single-route mode.
  if (m.num_routes > 1) {
    std::vector<LinearTerm> terms;
    for (RouteId r = 0; r < m.num_routes; ++r) terms.push_back({m.route_used_var(r), 1.0});
    mip.add_less_equal(std::move(terms), static_cast<double>(opts.max_routes), "route_cap");
  }

  VLOG(1) << "routing model: routes=" << m.num_routes << " covered=" << m.covered.size()
          << " vars=" << mip.num_vars() << " rows=" << mip.num_rows();
  return m;
}

} // namespace depotroute::core
