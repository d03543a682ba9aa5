/**
 * @file segmentation.hpp
 * @brief Collapse a node path into city-to-city legs.
 */

#pragma once

#include "geocoding.hpp"
#include "road_graph.hpp"

#include <string>
#include <vector>

/**
 * @brief One named stretch of the route.
 */
struct Leg {
    std::string name;
    double distance_km = 0.0;  ///< Covered since the previous leg
};

struct Segmentation {
    std::vector<Leg> legs;        ///< Intermediate legs, in travel order
    double remaining_m = 0.0;     ///< Distance left after the last leg
    std::string final_place;      ///< Last in-region place of the path
};

/**
 * @brief City-level narrative of a path.
 *
 * @p places holds the reverse-geocoded place of every path node. A leg is
 * emitted each time the place name changes, except for places outside
 * @p region_code (ignored) and for the final place, whose distance is left
 * in remaining_m for the destination leg. Step lengths use the shortest
 * variant of each bundle.
 *
 * @throws std::invalid_argument if places and path differ in length
 * @throws GraphError if consecutive path nodes are not connected
 */
Segmentation segment_route(const RoadGraph& graph,
                           const std::vector<NodeId>& path,
                           const std::vector<PlaceInfo>& places,
                           const std::string& region_code);
