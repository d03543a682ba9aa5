/**
 * @file geocoding.cpp
 * @brief Nominatim geocoder and offline gazetteer reverse geocoder.
 */

#include "geocoding.hpp"
#include "csv_utils.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>

using json = nlohmann::json;

// ============================================================
// NOMINATIM
// ============================================================

NominatimGeocoder::NominatimGeocoder(GeocoderConfig config)
    : config_(std::move(config)),
      http_(config_.timeout_seconds, config_.user_agent) {}

std::optional<Coordinate> NominatimGeocoder::resolve_place(const std::string& name) const {
    if (name.empty()) return std::nullopt;

    std::string url = config_.base_url + "/search?format=json&limit=1&q=" + HttpClient::url_encode(name);
    auto response = http_.get(url);
    if (!response) return std::nullopt;
    if (response->status != 200) {
        std::cerr << "Warning: geocoder returned HTTP " << response->status << " for '" << name << "'\n";
        return std::nullopt;
    }

    try {
        json results = json::parse(response->body);
        if (!results.is_array() || results.empty()) return std::nullopt;

        // Nominatim encodes coordinates as strings
        const auto& first = results[0];
        Coordinate coord;
        coord.lat = std::stod(first.at("lat").get<std::string>());
        coord.lon = std::stod(first.at("lon").get<std::string>());
        return coord;
    } catch (const std::exception& e) {
        std::cerr << "Warning: unreadable geocoder response for '" << name << "': " << e.what() << "\n";
        return std::nullopt;
    }
}

// ============================================================
// GAZETTEER
// ============================================================

GazetteerReverseGeocoder::GazetteerReverseGeocoder()
    : rtree_(std::make_unique<bgi::rtree<RTreeValue, bgi::quadratic<16>>>()) {}

void GazetteerReverseGeocoder::add_place(const PlaceInfo& place, Coordinate coord) {
    uint32_t idx = static_cast<uint32_t>(places_.size());
    places_.push_back(place);
    rtree_->insert({Point2D(coord.lon, coord.lat), idx});
}

bool GazetteerReverseGeocoder::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "Cannot open gazetteer: " << path << "\n";
        return false;
    }

    std::string header_line;
    std::getline(file, header_line);
    auto cols = csv_utils::parse_header(header_line);

    int idx_name = csv_utils::find_column(cols, {"name"});
    int idx_lat = csv_utils::find_column(cols, {"lat", "latitude"});
    int idx_lon = csv_utils::find_column(cols, {"lon", "lng", "longitude"});
    int idx_cc = csv_utils::find_column(cols, {"cc", "country_code"});
    if (idx_name < 0 || idx_lat < 0 || idx_lon < 0 || idx_cc < 0) {
        std::cerr << "Gazetteer needs name, lat, lon and cc columns: " << path << "\n";
        return false;
    }
    int min_cols = std::max({idx_name, idx_lat, idx_lon, idx_cc}) + 1;

    size_t before = places_.size();
    size_t skipped = 0;
    std::string line;
    while (std::getline(file, line)) {
        if (line.empty()) continue;
        auto row = csv_utils::split_line(line);
        if (static_cast<int>(row.size()) < min_cols) {
            ++skipped;
            continue;
        }
        try {
            Coordinate coord{std::stod(csv_utils::trim(row[idx_lat])),
                             std::stod(csv_utils::trim(row[idx_lon]))};
            add_place({csv_utils::trim(row[idx_name]), csv_utils::trim(row[idx_cc])}, coord);
        } catch (const std::exception&) {
            ++skipped;
        }
    }

    if (skipped > 0) {
        std::cerr << "Warning: skipped " << skipped << " malformed gazetteer rows\n";
    }
    std::cout << "  Loaded " << (places_.size() - before) << " gazetteer places\n";
    return places_.size() > before;
}

std::optional<std::vector<PlaceInfo>> GazetteerReverseGeocoder::reverse_resolve(
    const std::vector<Coordinate>& coords) const {
    if (places_.empty()) return std::nullopt;

    std::vector<PlaceInfo> out;
    out.reserve(coords.size());
    std::vector<RTreeValue> hit;
    for (const auto& c : coords) {
        hit.clear();
        rtree_->query(bgi::nearest(Point2D(c.lon, c.lat), 1), std::back_inserter(hit));
        if (hit.empty()) return std::nullopt;
        out.push_back(places_[hit.front().second]);
    }
    return out;
}
