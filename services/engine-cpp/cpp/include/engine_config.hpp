/**
 * @file engine_config.hpp
 * @brief Engine configuration loaded from JSON.
 */

#pragma once

#include <map>
#include <string>

/**
 * @brief Where the road graph is read from.
 * db_path wins over the node/edge files when DuckDB support is built in.
 */
struct GraphSource {
    std::string nodes_path;
    std::string edges_path;
    std::string db_path;
};

/**
 * @brief Nominatim-compatible geocoding service.
 */
struct GeocoderConfig {
    std::string base_url = "https://nominatim.openstreetmap.org";
    std::string country_suffix = "Benin";   ///< appended on a second attempt
    std::string user_agent = "itinerary-engine/1.0";
    long timeout_seconds = 30;
};

/**
 * @brief Generative-language translation service.
 */
struct TranslatorConfig {
    std::string base_url = "https://generativelanguage.googleapis.com/v1beta";
    std::string model = "gemini-2.0-flash";
    std::string api_key_env = "GEMINI_API_KEY";
    std::string target_language = "Fon";
    long timeout_seconds = 30;
};

/**
 * @brief Narrative heuristics of the route planner.
 */
struct PlannerConfig {
    std::string region_code = "BJ";         ///< Only routes inside this country
    double avoid_radius_km = 3.0;
    double rain_latitude_threshold = 9.8;   ///< Northern roads degrade in the rain
    double rain_delay_seconds = 1800.0;
    double bus_fare_per_km = 18.0;
    double taxi_fare_per_km = 30.0;
    int split_trip_hours = 10;
};

struct EngineConfig {
    int port = 8080;
    std::string host = "0.0.0.0";
    std::string index_type = "h3";
    GraphSource graph;
    std::string gazetteer_path;
    GeocoderConfig geocoder;
    TranslatorConfig translator;
    PlannerConfig planner;
    std::map<std::string, std::string> local_names = default_local_names();

    /// Fon names of the main cities, keyed by their French name.
    static std::map<std::string, std::string> default_local_names();
};

/**
 * @brief Overlay a JSON config file onto @p config.
 * Keys absent from the file keep their current value.
 * @return false if the file is missing or malformed
 */
bool load_config(const std::string& config_path, EngineConfig& config);
