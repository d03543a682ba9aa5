/**
 * @file segmentation.cpp
 * @brief Segmentation reducer implementation.
 */

#include "segmentation.hpp"
#include "path_metrics.hpp"

#include <stdexcept>

Segmentation segment_route(const RoadGraph& graph,
                           const std::vector<NodeId>& path,
                           const std::vector<PlaceInfo>& places,
                           const std::string& region_code) {
    if (places.size() != path.size()) {
        throw std::invalid_argument("segment_route: " + std::to_string(places.size()) +
                                    " places for " + std::to_string(path.size()) + " nodes");
    }

    Segmentation out;
    if (path.empty()) return out;

    // Last place inside the region, or the very last one if none is
    out.final_place = places.back().name;
    for (auto it = places.rbegin(); it != places.rend(); ++it) {
        if (it->country_code == region_code) {
            out.final_place = it->name;
            break;
        }
    }

    std::string current = places.front().name;
    double segment_m = 0.0;

    for (size_t i = 0; i + 1 < path.size(); ++i) {
        segment_m += shortest_length(require_bundle(graph, path[i], path[i + 1]));

        const PlaceInfo& next = places[i + 1];
        if (next.country_code != region_code) continue;
        if (next.name == current) continue;

        if (next.name != out.final_place) {
            out.legs.push_back({next.name, segment_m / 1000.0});
            segment_m = 0.0;
        }
        current = next.name;
    }

    out.remaining_m = segment_m;
    return out;
}
