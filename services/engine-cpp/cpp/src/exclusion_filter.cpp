/**
 * @file exclusion_filter.cpp
 * @brief Exclusion zone implementation.
 */

#include "exclusion_filter.hpp"

#include <iostream>

namespace {

constexpr double kKmPerDegree = 111.0;

}  // namespace

ExclusionSet nodes_within_radius(const RoadGraph& graph, Coordinate center, double radius_km) {
    ExclusionSet excluded;
    if (!(radius_km > 0.0)) return excluded;

    const double limit = radius_km / kKmPerDegree;
    const double limit_sq = limit * limit;

    for (const auto& node : graph.nodes()) {
        double dy = node.coord.lat - center.lat;
        double dx = node.coord.lon - center.lon;
        if (dy * dy + dx * dx < limit_sq) {
            excluded.insert(node.id);
        }
    }
    return excluded;
}

ExclusionSet build_exclusion_set(const RoadGraph& graph,
                                 const Geocoder& geocoder,
                                 const std::string& place_name,
                                 double radius_km) {
    auto center = geocoder.resolve_place(place_name);
    if (!center) {
        std::cerr << "Warning: cannot locate '" << place_name << "', nothing excluded\n";
        return {};
    }
    return nodes_within_radius(graph, *center, radius_km);
}
