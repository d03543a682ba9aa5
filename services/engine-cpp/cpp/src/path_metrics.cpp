/**
 * @file path_metrics.cpp
 * @brief Path metrics implementation.
 */

#include "path_metrics.hpp"

#include <algorithm>
#include <cmath>
#include <string>

const EdgeBundle& require_bundle(const RoadGraph& graph, NodeId from, NodeId to) {
    const EdgeBundle* bundle = graph.find_bundle(from, to);
    if (!bundle || bundle->variants.empty()) {
        throw GraphError("No edge between " + std::to_string(from) + " and " + std::to_string(to));
    }
    return *bundle;
}

const EdgeVariant& fastest_variant(const EdgeBundle& bundle) {
    return *std::min_element(bundle.variants.begin(), bundle.variants.end(),
                             [](const EdgeVariant& a, const EdgeVariant& b) {
                                 return a.travel_time < b.travel_time;
                             });
}

double shortest_length(const EdgeBundle& bundle) {
    return min_weight(bundle, WeightField::Length);
}

PathMetrics compute_path_metrics(const RoadGraph& graph, const std::vector<NodeId>& path) {
    PathMetrics metrics;
    for (size_t i = 0; i + 1 < path.size(); ++i) {
        const EdgeVariant& edge = fastest_variant(require_bundle(graph, path[i], path[i + 1]));
        metrics.distance_m += edge.length;
        if (std::isfinite(edge.travel_time)) {
            metrics.time_s += edge.travel_time;
        }
    }
    return metrics;
}
