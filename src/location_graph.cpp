/*
  LocationGraph — immutable hub + depot graph with dense pair storage.

  Construction validates the location table, then fills an N x N matrix from
  the edge table. Mirroring fills reverse pairs in a second pass so explicit
  rows always win over mirrored ones, independent of table order.
*/
#include "depotroute/core/location_graph.hpp"
#include "depotroute/core/error.hpp"

#include <cmath>

#include "absl/strings/str_cat.h"

namespace depotroute::core {

namespace {

bool finite_non_negative(double v) { return std::isfinite(v) && v >= 0.0; }

} // namespace

LocationGraph LocationGraph::from_tables(
    std::span<const Location> locations,
    std::span<const Edge> edges,
    bool mirror) {

  LocationGraph g;
  g.locations_.assign(locations.begin(), locations.end());
  const std::size_t n = g.locations_.size();

  // Invariants: unique non-empty ids, exactly one hub, non-negative costs
  for (std::size_t i = 0; i < n; ++i) {
    const auto& loc = g.locations_[i];
    if (loc.id.empty()) {
      throw ValidationError(absl::StrCat("location at row ", i, " has an empty id"));
    }
    if (!g.index_.emplace(loc.id, static_cast<NodeId>(i)).second) {
      throw ValidationError(absl::StrCat("duplicate location id '", loc.id, "'"));
    }
    if (!finite_non_negative(loc.direct_cost)) {
      throw ValidationError(absl::StrCat("location '", loc.id, "': direct-ship cost must be >= 0"));
    }
    if (loc.role == LocationRole::Hub) {
      if (g.hub_ != kNoNode) {
        throw ValidationError(absl::StrCat("more than one hub: '", g.locations_[static_cast<std::size_t>(g.hub_)].id,
                                           "' and '", loc.id, "'"));
      }
      g.hub_ = static_cast<NodeId>(i);
    }
  }
  if (g.hub_ == kNoNode) {
    throw ValidationError("location table has no hub");
  }
  if (!g.locations_[static_cast<std::size_t>(g.hub_)].included) {
    throw ValidationError(absl::StrCat("hub '", g.locations_[static_cast<std::size_t>(g.hub_)].id,
                                       "' must be included"));
  }

  g.time_.assign(n * n, 0.0);
  g.distance_.assign(n * n, 0.0);
  g.has_time_.assign(n * n, 0);
  g.has_distance_.assign(n * n, 0);

  // Pass 1: explicit rows
  std::vector<std::pair<NodeId, NodeId>> pairs;
  pairs.reserve(edges.size());
  for (const auto& e : edges) {
    auto a = g.find(e.from);
    auto b = g.find(e.to);
    if (!a) throw ValidationError(absl::StrCat("edge references unknown location '", e.from, "'"));
    if (!b) throw ValidationError(absl::StrCat("edge references unknown location '", e.to, "'"));
    if (*a == *b) throw ValidationError(absl::StrCat("self-loop edge at '", e.from, "'"));
    if (!finite_non_negative(e.time)) {
      throw ValidationError(absl::StrCat("edge ", e.from, "->", e.to, ": drive time must be >= 0"));
    }
    if (e.distance && !finite_non_negative(*e.distance)) {
      throw ValidationError(absl::StrCat("edge ", e.from, "->", e.to, ": drive distance must be >= 0"));
    }
    const auto s = g.slot(*a, *b);
    if (g.has_time_[s]) {
      const bool same = g.time_[s] == e.time &&
                        static_cast<bool>(g.has_distance_[s]) == e.distance.has_value() &&
                        (!e.distance || g.distance_[s] == *e.distance);
      if (!same) {
        throw ValidationError(absl::StrCat("conflicting duplicate edge ", e.from, "->", e.to));
      }
      continue;
    }
    g.time_[s] = e.time;
    g.has_time_[s] = 1;
    if (e.distance) {
      g.distance_[s] = *e.distance;
      g.has_distance_[s] = 1;
    }
    pairs.emplace_back(*a, *b);
  }

  // Pass 2: mirrored rows fill only undefined reverse pairs
  if (mirror) {
    for (const auto& [a, b] : pairs) {
      const auto fwd = g.slot(a, b);
      const auto rev = g.slot(b, a);
      if (g.has_time_[rev]) continue;
      g.time_[rev] = g.time_[fwd];
      g.has_time_[rev] = 1;
      g.distance_[rev] = g.distance_[fwd];
      g.has_distance_[rev] = g.has_distance_[fwd];
    }
  }
  return g;
}

std::optional<NodeId> LocationGraph::find(const std::string& id) const {
  auto it = index_.find(id);
  if (it == index_.end()) return std::nullopt;
  return it->second;
}

NodeId LocationGraph::index_of(const std::string& id) const {
  auto n = find(id);
  if (!n) throw ValidationError(absl::StrCat("unknown location id '", id, "'"));
  return *n;
}

bool LocationGraph::has_edge(NodeId a, NodeId b) const noexcept {
  const auto n = num_locations();
  if (a < 0 || b < 0 || a >= n || b >= n) return false;
  return has_time_[slot(a, b)] != 0;
}

bool LocationGraph::has_distance(NodeId a, NodeId b) const noexcept {
  return has_edge(a, b) && has_distance_[slot(a, b)] != 0;
}

Minutes LocationGraph::time(NodeId a, NodeId b) const {
  if (!has_edge(a, b)) {
    throw ValidationError(absl::StrCat("no drive time defined for ", location(a).id, "->", location(b).id));
  }
  return time_[slot(a, b)];
}

Miles LocationGraph::distance(NodeId a, NodeId b) const {
  if (!has_distance(a, b)) {
    throw ValidationError(absl::StrCat("no drive distance defined for ", location(a).id, "->", location(b).id));
  }
  return distance_[slot(a, b)];
}

NodeId LocationGraph::start_of(const PlanOptions& opts) const {
  return opts.start ? index_of(*opts.start) : hub_;
}

NodeId LocationGraph::end_of(const PlanOptions& opts) const {
  return opts.end ? index_of(*opts.end) : hub_;
}

bool LocationGraph::is_routable(NodeId n, NodeId start, NodeId end) const {
  const auto& loc = location(n);
  return n != hub_ && n != start && n != end && loc.included &&
         loc.fixed != FixedDecision::ForceDirect;
}

bool LocationGraph::is_route_arc(NodeId a, NodeId b, NodeId start, NodeId end) const {
  if (a == b) return false;
  const bool a_ok = a == start || is_routable(a, start, end);
  const bool b_ok = b == end || is_routable(b, start, end);
  if (!a_ok || !b_ok) return false;
  if (start != end) {
    if (a == end || b == start) return false;
    if (a == start && b == end) return false;
  }
  return true;
}

void LocationGraph::validate_for(const PlanOptions& opts) const {
  if (opts.max_routes < 1) {
    throw ValidationError(absl::StrCat("max_routes must be >= 1 (got ", opts.max_routes, ")"));
  }
  if (!finite_non_negative(opts.max_drive_time)) {
    throw ValidationError("max drive-time budget must be >= 0");
  }
  const auto& c = opts.cost;
  if (c.model == CostModel::Flat && !finite_non_negative(c.cost_per_minute)) {
    throw ValidationError("flat cost per minute must be >= 0");
  }
  if (c.model == CostModel::Itemized &&
      (!finite_non_negative(c.gas_cost_per_mile) || !finite_non_negative(c.staff_cost_per_hour))) {
    throw ValidationError("itemized cost coefficients must be >= 0");
  }
  if (opts.solver.time_limit && opts.solver.time_limit->count() <= 0) {
    throw ValidationError("solver time limit must be positive when set");
  }

  const NodeId start = start_of(opts);
  const NodeId end = end_of(opts);
  for (NodeId anchor : {start, end}) {
    if (!location(anchor).included) {
      throw ValidationError(absl::StrCat("start/end location '", location(anchor).id, "' is not included"));
    }
  }

  const auto n = num_locations();
  for (NodeId a = 0; a < n; ++a) {
    for (NodeId b = 0; b < n; ++b) {
      if (!is_route_arc(a, b, start, end)) continue;
      if (!has_edge(a, b)) {
        throw ValidationError(absl::StrCat("missing required edge ", location(a).id, "->", location(b).id));
      }
      if (c.model == CostModel::Itemized && !has_distance(a, b)) {
        throw ValidationError(absl::StrCat("itemized cost model needs a distance for ",
                                           location(a).id, "->", location(b).id));
      }
    }
  }
}

} // namespace depotroute::core
