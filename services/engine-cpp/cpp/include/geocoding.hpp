/**
 * @file geocoding.hpp
 * @brief Place name <-> coordinate resolution.
 */

#pragma once

#include "engine_config.hpp"
#include "http_client.hpp"
#include "road_graph.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Populated place returned by reverse geocoding.
 */
struct PlaceInfo {
    std::string name;
    std::string country_code;  ///< ISO 3166-1 alpha-2, e.g. "BJ"
};

/**
 * @brief Free-text place name -> coordinate.
 */
class Geocoder {
public:
    virtual ~Geocoder() = default;

    /// std::nullopt when the name cannot be resolved or the service fails.
    virtual std::optional<Coordinate> resolve_place(const std::string& name) const = 0;
};

/**
 * @brief Coordinates -> nearest populated places, in one batch.
 */
class ReverseGeocoder {
public:
    virtual ~ReverseGeocoder() = default;

    /// Same length and order as @p coords, std::nullopt on failure.
    virtual std::optional<std::vector<PlaceInfo>> reverse_resolve(
        const std::vector<Coordinate>& coords) const = 0;
};

/**
 * @brief Geocoder backed by a Nominatim search endpoint.
 */
class NominatimGeocoder : public Geocoder {
public:
    explicit NominatimGeocoder(GeocoderConfig config);

    std::optional<Coordinate> resolve_place(const std::string& name) const override;

private:
    GeocoderConfig config_;
    HttpClient http_;
};

/**
 * @brief Offline reverse geocoder over a table of populated places.
 *
 * Each coordinate maps to the closest place in (lat, lon) degrees.
 */
class GazetteerReverseGeocoder : public ReverseGeocoder {
public:
    GazetteerReverseGeocoder();

    /**
     * @brief Load a CSV with name, lat, lon and cc columns.
     * Column order is read from the header (GeoNames cities layout works).
     * @return true if at least one place was loaded
     */
    bool load(const std::string& path);

    void add_place(const PlaceInfo& place, Coordinate coord);

    std::optional<std::vector<PlaceInfo>> reverse_resolve(
        const std::vector<Coordinate>& coords) const override;

    size_t size() const { return places_.size(); }

private:
    std::vector<PlaceInfo> places_;
    std::unique_ptr<bgi::rtree<RTreeValue, bgi::quadratic<16>>> rtree_;
};
