/**
 * @file path_metrics.hpp
 * @brief Distance and time totals of a node path.
 */

#pragma once

#include "road_graph.hpp"

#include <vector>

struct PathMetrics {
    double distance_m = 0.0;  ///< Total length in meters
    double time_s = 0.0;      ///< Total travel time in seconds
};

/**
 * @brief Variant with the lowest travel time (first one on ties).
 *
 * Used as the representative segment of a bundle so that distance and time
 * describe the same road whatever field the search optimised.
 */
const EdgeVariant& fastest_variant(const EdgeBundle& bundle);

/**
 * @brief Shortest length among the variants of a bundle.
 */
double shortest_length(const EdgeBundle& bundle);

/**
 * @brief Sum length and travel time along consecutive node pairs.
 *
 * Unknown travel times count as zero.
 * @throws GraphError if two consecutive nodes are not connected
 */
PathMetrics compute_path_metrics(const RoadGraph& graph, const std::vector<NodeId>& path);

/**
 * @brief Bundle between two consecutive path nodes.
 * @throws GraphError if it does not exist
 */
const EdgeBundle& require_bundle(const RoadGraph& graph, NodeId from, NodeId to);
