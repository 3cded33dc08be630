/* Immutable hub + depot graph with a dense pairwise time/distance matrix. */
#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include "depotroute/core/options.hpp"
#include "depotroute/core/types.hpp"

namespace depotroute::core {

struct Location {
  std::string id;
  LocationRole role { LocationRole::Depot };
  bool included { true };
  Money direct_cost { 0.0 };
  FixedDecision fixed { FixedDecision::Unconstrained };
};

// Directed pair (from -> to). Distance is optional; only the itemized cost
// model requires it.
struct Edge {
  std::string from;
  std::string to;
  Minutes time { 0.0 };
  std::optional<Miles> distance {};
};

// Notes on node identifiers:
// - NodeId is the row of a location in the table passed to from_tables; the
//   order of the input table is preserved.
// - Pair data is stored row-major in an N x N matrix; undefined pairs are
//   tracked with a presence mask rather than sentinel values.
class LocationGraph {
public:
  // Validates ids, roles and numerics. With mirror=true every edge also
  // defines its reverse pair unless the table defines the reverse itself.
  [[nodiscard]] static LocationGraph from_tables(
      std::span<const Location> locations,
      std::span<const Edge> edges,
      bool mirror);
  ~LocationGraph() noexcept = default;

  [[nodiscard]] std::int32_t num_locations() const noexcept {
    return static_cast<std::int32_t>(locations_.size());
  }
  [[nodiscard]] NodeId hub() const noexcept { return hub_; }
  [[nodiscard]] const Location& location(NodeId n) const { return locations_.at(static_cast<std::size_t>(n)); }
  [[nodiscard]] std::span<const Location> locations() const noexcept { return locations_; }

  [[nodiscard]] std::optional<NodeId> find(const std::string& id) const;
  // Throws ValidationError for an unknown id.
  [[nodiscard]] NodeId index_of(const std::string& id) const;

  [[nodiscard]] bool has_edge(NodeId a, NodeId b) const noexcept;
  [[nodiscard]] bool has_distance(NodeId a, NodeId b) const noexcept;
  // Throw ValidationError when the pair (or its distance) is undefined.
  [[nodiscard]] Minutes time(NodeId a, NodeId b) const;
  [[nodiscard]] Miles distance(NodeId a, NodeId b) const;
  [[nodiscard]] Minutes time(const std::string& a, const std::string& b) const {
    return time(index_of(a), index_of(b));
  }
  [[nodiscard]] Miles distance(const std::string& a, const std::string& b) const {
    return distance(index_of(a), index_of(b));
  }

  // Anchors resolved against options (hub when unset).
  [[nodiscard]] NodeId start_of(const PlanOptions& opts) const;
  [[nodiscard]] NodeId end_of(const PlanOptions& opts) const;

  // Locations that may be visited by a route: included, not the hub, not an
  // anchor, not forced to direct shipment.
  [[nodiscard]] bool is_routable(NodeId n, NodeId start, NodeId end) const;

  // True when a route may select a -> b: both endpoints are anchors or
  // routable, nothing enters start or leaves end unless start == end, and an
  // open route never jumps straight from start to end.
  [[nodiscard]] bool is_route_arc(NodeId a, NodeId b, NodeId start, NodeId end) const;

  // Configuration-dependent checks: anchors exist and are included, the
  // route count and budget are sane, every ordered pair among anchors and
  // routable locations is defined, and distances exist when the itemized
  // cost model needs them. Throws ValidationError naming the first violation.
  void validate_for(const PlanOptions& opts) const;

private:
  [[nodiscard]] std::size_t slot(NodeId a, NodeId b) const noexcept {
    return static_cast<std::size_t>(a) * locations_.size() + static_cast<std::size_t>(b);
  }

  std::vector<Location> locations_ {};
  std::unordered_map<std::string, NodeId> index_ {};
  NodeId hub_ { kNoNode };
  // Dense N x N pair storage
  std::vector<Minutes> time_ {};
  std::vector<Miles> distance_ {};
  std::vector<std::uint8_t> has_time_ {};
  std::vector<std::uint8_t> has_distance_ {};
};

} // namespace depotroute::core
