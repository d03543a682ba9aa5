/**
 * @file exclusion_filter.hpp
 * @brief Turn "avoid this place" into a set of excluded nodes.
 */

#pragma once

#include "bidirectional_search.hpp"
#include "geocoding.hpp"

#include <string>

/**
 * @brief Nodes strictly within @p radius_km of @p center.
 *
 * The radius is converted to degrees with 1 degree = 111 km and compared
 * against the plain (lat, lon) Euclidean distance. Away from the equator the
 * zone therefore covers less ground east-west than north-south.
 */
ExclusionSet nodes_within_radius(const RoadGraph& graph, Coordinate center, double radius_km);

/**
 * @brief Geocode @p place_name and collect the nodes around it.
 *
 * Best effort: an unresolvable name yields an empty set.
 */
ExclusionSet build_exclusion_set(const RoadGraph& graph,
                                 const Geocoder& geocoder,
                                 const std::string& place_name,
                                 double radius_km);
