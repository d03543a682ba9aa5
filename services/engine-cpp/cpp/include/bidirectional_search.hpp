/**
 * @file bidirectional_search.hpp
 * @brief Bidirectional Dijkstra over a RoadGraph with node exclusion.
 */

#pragma once

#include "road_graph.hpp"

#include <functional>
#include <string>
#include <unordered_set>
#include <vector>

/**
 * @brief Nodes the search may not expand or enter.
 */
using ExclusionSet = std::unordered_set<NodeId>;

/**
 * @brief Cooperative cancellation hook, polled once per search round.
 * Returns true to abandon the search.
 */
using CancelCheck = std::function<bool()>;

enum class SearchStatus {
    Found,          ///< path and cost are valid
    NoPath,         ///< frontiers never met
    NodeNotFound,   ///< start or end is not in the graph
    Cancelled       ///< CancelCheck requested a stop
};

const char* search_status_name(SearchStatus status);

/**
 * @brief Result of a shortest path query.
 */
struct SearchResult {
    std::vector<NodeId> path;   ///< start..end inclusive, empty unless Found
    double cost = kInfinity;    ///< Total cost under the chosen weight field
    SearchStatus status = SearchStatus::NoPath;
    std::string error;          ///< Error description if not reachable
    size_t settled = 0;         ///< Nodes settled by both frontiers

    bool reachable() const { return status == SearchStatus::Found; }
};

/**
 * @brief Bidirectional Dijkstra between two nodes.
 *
 * Both frontiers advance once per round. The weight of a step is the
 * minimum of @p weight over the parallel variants between the two nodes.
 * Excluded nodes are never expanded nor entered, endpoints included;
 * start == end always yields a single-node path of cost 0.
 *
 * The function keeps all search state local, so concurrent calls on the
 * same graph are safe.
 */
SearchResult bidirectional_dijkstra(const RoadGraph& graph,
                                    NodeId start,
                                    NodeId end,
                                    WeightField weight,
                                    const ExclusionSet& excluded = {},
                                    const CancelCheck& cancelled = {});
