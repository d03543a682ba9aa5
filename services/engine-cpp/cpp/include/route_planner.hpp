/**
 * @file route_planner.hpp
 * @brief City-to-city itinerary planning on top of the search engine.
 *
 * Turns two free-text place names into a narrative route: departure,
 * intermediate legs, destination, season label and a summary line with
 * distance, duration and fare estimates.
 */

#pragma once

#include "bidirectional_search.hpp"
#include "engine_config.hpp"
#include "geocoding.hpp"
#include "path_metrics.hpp"
#include "place_names.hpp"
#include "segmentation.hpp"
#include "translator.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

enum class Season { Dry, Rain };

/// Accepts "dry" and "rain", ignoring ASCII case.
bool parse_season(const std::string& text, Season& out);

/// French label, e.g. "Saison Sèche".
const char* season_label(Season season);

struct RouteRequest {
    std::string start;
    std::string end;
    std::string avoid;                      ///< Empty for none
    Season season = Season::Dry;
    WeightField weight = WeightField::TravelTime;
};

struct RouteResult {
    std::string departure;                  ///< Rendered start name
    std::vector<Leg> steps;                 ///< Rendered intermediate legs
    Leg destination;
    std::optional<std::string> avoid_city;
    std::string season_source;              ///< French label
    std::string season;                     ///< Translated label
    std::string summary_source;
    std::string summary;

    // Untranslated figures
    PathMetrics metrics;
    WeightField weight = WeightField::TravelTime;
    double cost = 0.0;                      ///< Search cost in weight units
    bool weather_degraded = false;
    double weather_delay_s = 0.0;
    long long bus_fare = 0;
    long long taxi_fare = 0;
    size_t node_count = 0;
    size_t excluded_nodes = 0;
    size_t settled_nodes = 0;               ///< Search effort, both frontiers
};

/**
 * @brief Read a /route JSON body into a request.
 *
 * start and end are required strings; avoid, season and weight may be
 * absent or null, otherwise they must be strings.
 * @return false with a message in `problem` on bad input
 */
bool parse_route_request(const std::string& text, RouteRequest& request, std::string& problem);

/**
 * @brief Request failure reported to the caller.
 *
 * Input and NoPath are client errors; Internal covers graph integrity
 * problems and search failures.
 */
class RouteError : public std::runtime_error {
public:
    enum class Kind { Input, NoPath, Internal };

    RouteError(Kind kind, const std::string& message, std::string details = {})
        : std::runtime_error(message), kind_(kind), details_(std::move(details)) {}

    Kind kind() const { return kind_; }
    const std::string& details() const { return details_; }

private:
    Kind kind_;
    std::string details_;
};

class RoutePlanner {
public:
    RoutePlanner(const RoadGraph& graph,
                 const Geocoder& geocoder,
                 const ReverseGeocoder& reverse_geocoder,
                 const Translator& translator,
                 PlannerConfig config,
                 PlaceNameLocalizer localizer,
                 std::string country_suffix);

    /**
     * @brief Plan a route between two place names.
     * @throws RouteError
     */
    RouteResult compute_route(const RouteRequest& request, const CancelCheck& cancel = {}) const;

    const PlannerConfig& config() const { return config_; }

private:
    /// Raw query first, then "query, <country suffix>".
    std::optional<Coordinate> smart_geocode(const std::string& query) const;

    std::string translate_or_keep(const std::string& text) const;

    std::string build_summary(const RouteResult& result) const;

    const RoadGraph& graph_;
    const Geocoder& geocoder_;
    const ReverseGeocoder& reverse_geocoder_;
    const Translator& translator_;
    PlannerConfig config_;
    PlaceNameLocalizer localizer_;
    std::string country_suffix_;
};

/**
 * @brief Response document: departure, step_1..step_n, destination,
 * avoid_city (optional), season, info_sup and a metrics object.
 */
nlohmann::ordered_json route_result_to_json(const RouteResult& result);

/// {"error", "details"} body for a failed request.
nlohmann::json route_error_to_json(const RouteError& error);
