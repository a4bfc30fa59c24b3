/// @file src/core/routes.cpp
/// @brief DistanceRoute factory and RouteMap index.

#include "biosettle/routes.hpp"

#include <cmath>

namespace biosettle {

// ─── DistanceRoute ────────────────────────────────────────────────────────────

DistanceRoute::DistanceRoute(NodeId origin, NodeId destination, double km, bool segment) noexcept
    : origin_id_(origin)
    , destination_id_(destination)
    , distance_km_(km)
    , is_segment_link_(segment)
{}

std::optional<DistanceRoute>
DistanceRoute::make(NodeId origin_id,
                    NodeId destination_id,
                    double distance_km,
                    bool   is_segment_link) noexcept {
    if (!std::isfinite(distance_km) || distance_km <= 0.0) {
        return std::nullopt;
    }
    return DistanceRoute(origin_id, destination_id, distance_km, is_segment_link);
}

// ─── RouteMap ─────────────────────────────────────────────────────────────────

RouteMap::RouteMap(std::span<const DistanceRoute> routes) {
    for (const auto& route : routes) {
        if (!insert(route)) {
            ++duplicates_;
        }
    }
}

bool RouteMap::insert(const DistanceRoute& route) {
    const RouteKey key{route.origin_id(), route.destination_id(), route.is_segment_link()};
    return routes_.try_emplace(key, route).second;
}

std::optional<DistanceRoute>
RouteMap::find(NodeId origin_id, NodeId destination_id, bool is_segment_link) const {
    const auto it = routes_.find(RouteKey{origin_id, destination_id, is_segment_link});
    if (it == routes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace biosettle
