#pragma once

/// @file include/biosettle/routes.hpp
/// @brief Distance graph edges and the keyed route index.
///
/// A `DistanceRoute` is one edge between logistics nodes. The same
/// origin/destination pair may appear twice: once as a direct ("main haul")
/// edge and once as an intermediate pickup edge of a linked trip, so the
/// segment flag is part of the key.

#include "biosettle/types.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <span>
#include <tuple>

namespace biosettle {

// ─── DistanceRoute ────────────────────────────────────────────────────────────

class DistanceRoute {
public:
    /// # Returns
    /// `nullopt` unless `distance_km` is finite and > 0.
    [[nodiscard]] static std::optional<DistanceRoute>
    make(NodeId origin_id,
         NodeId destination_id,
         double distance_km,
         bool   is_segment_link = false) noexcept;

    [[nodiscard]] NodeId origin_id() const noexcept { return origin_id_; }
    [[nodiscard]] NodeId destination_id() const noexcept { return destination_id_; }
    [[nodiscard]] double distance_km() const noexcept { return distance_km_; }
    [[nodiscard]] bool is_segment_link() const noexcept { return is_segment_link_; }

private:
    DistanceRoute(NodeId origin, NodeId destination, double km, bool segment) noexcept;

    NodeId origin_id_;
    NodeId destination_id_;
    double distance_km_;
    bool   is_segment_link_;  ///< Pickup leg of a linked trip, not a main haul
};

// ─── RouteKey ─────────────────────────────────────────────────────────────────

struct RouteKey {
    NodeId origin_id;
    NodeId destination_id;
    bool   is_segment_link;

    friend bool operator<(const RouteKey& a, const RouteKey& b) noexcept {
        return std::tie(a.origin_id, a.destination_id, a.is_segment_link)
             < std::tie(b.origin_id, b.destination_id, b.is_segment_link);
    }
};

// ─── RouteMap ─────────────────────────────────────────────────────────────────

/// Index of distance routes keyed by (origin, destination, segment flag).
///
/// Keys are unique: the first route inserted under a key wins and later
/// duplicates are refused.
class RouteMap {
public:
    RouteMap() = default;

    /// Build from a list of routes. Duplicates after the first are dropped;
    /// see `duplicates_dropped()`.
    explicit RouteMap(std::span<const DistanceRoute> routes);

    /// Insert a route.
    ///
    /// # Returns
    /// `false` if a route with the same key is already present (the stored
    /// route is left unchanged).
    bool insert(const DistanceRoute& route);

    [[nodiscard]] std::optional<DistanceRoute>
    find(NodeId origin_id, NodeId destination_id, bool is_segment_link) const;

    [[nodiscard]] std::size_t size() const noexcept { return routes_.size(); }
    [[nodiscard]] bool empty() const noexcept { return routes_.empty(); }

    /// Number of routes refused by the span constructor as duplicate keys.
    [[nodiscard]] std::size_t duplicates_dropped() const noexcept { return duplicates_; }

private:
    std::map<RouteKey, DistanceRoute> routes_;
    std::size_t                       duplicates_ = 0;
};

}  // namespace biosettle
