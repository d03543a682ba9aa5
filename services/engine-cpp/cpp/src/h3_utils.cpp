/**
 * @file h3_utils.cpp
 * @brief H3 helpers implementation.
 */

#include "h3_utils.hpp"
#include <h3/h3api.h>
#include <cmath>

namespace h3_utils {

uint64_t latlng_to_cell(double lat, double lng, int res) {
    if (res < 0 || res > 15) return 0;
    if (!std::isfinite(lat) || !std::isfinite(lng)) return 0;

    LatLng ll;
    ll.lat = lat * M_PI / 180.0;  // Convert to radians
    ll.lng = lng * M_PI / 180.0;

    H3Index cell = 0;
    if (latLngToCell(&ll, res, &cell) != E_SUCCESS) {
        return 0;
    }
    return cell;
}

std::vector<uint64_t> grid_ring(uint64_t center, int k) {
    std::vector<uint64_t> result;
    if (center == 0 || k < 0) return result;

    if (k == 0) {
        result.push_back(center);
        return result;
    }

    int64_t disk_size = 0;
    if (maxGridDiskSize(k, &disk_size) != E_SUCCESS) {
        return result;
    }

    // One disk query with distances; keep the cells exactly k steps away.
    // Unlike gridRingUnsafe this also works around pentagons.
    std::vector<H3Index> disk(disk_size, 0);
    std::vector<int> distances(disk_size, -1);
    if (gridDiskDistances(center, k, disk.data(), distances.data()) != E_SUCCESS) {
        return result;
    }

    for (int64_t i = 0; i < disk_size; ++i) {
        if (disk[i] != 0 && distances[i] == k) {
            result.push_back(disk[i]);
        }
    }
    return result;
}

double cell_edge_length_m(uint64_t cell) {
    if (cell == 0) return 0.0;

    double area_m2 = 0.0;
    if (cellAreaM2(cell, &area_m2) != E_SUCCESS || area_m2 <= 0.0) {
        return 0.0;
    }
    // Regular hexagon: area = 3 * sqrt(3) / 2 * edge^2
    return std::sqrt(2.0 * area_m2 / (3.0 * std::sqrt(3.0)));
}

}  // namespace h3_utils
