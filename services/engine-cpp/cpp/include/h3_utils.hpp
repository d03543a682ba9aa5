/**
 * @file h3_utils.hpp
 * @brief H3 helpers for the node spatial index.
 */

#pragma once

#include <cstdint>
#include <vector>

namespace h3_utils {

/**
 * @brief Convert lat/lng to H3 cell at given resolution.
 * @return Cell index, 0 on invalid input
 */
uint64_t latlng_to_cell(double lat, double lng, int res);

/**
 * @brief Get ring of cells at distance k from center.
 * @param center Center H3 cell
 * @param k Ring distance (0 = just center, 1 = immediate neighbors, etc.)
 * @return Vector of cell IDs in ring
 */
std::vector<uint64_t> grid_ring(uint64_t center, int k);

/**
 * @brief Edge length in meters of a regular hexagon with the cell's area.
 * @return Edge length, 0 on invalid cell
 */
double cell_edge_length_m(uint64_t cell);

}  // namespace h3_utils
