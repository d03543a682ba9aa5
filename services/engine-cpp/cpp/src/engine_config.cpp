/**
 * @file engine_config.cpp
 * @brief JSON config loading.
 */

#include "engine_config.hpp"

#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

std::map<std::string, std::string> EngineConfig::default_local_names() {
    return {
        {"Cotonou", "Kutɔnu"},
        {"Porto-Novo", "Xɔgbonu"},
        {"Abomey", "Agbomɛ"},
        {"Ouidah", "Glexwé"},
        {"Bohicon", "Bɔxikɔn"},
        {"Allada", "Alada"},
    };
}

bool load_config(const std::string& config_path, EngineConfig& config) {
    std::ifstream file(config_path);
    if (!file) {
        std::cerr << "Config file not found: " << config_path << "\n";
        return false;
    }

    try {
        json root = json::parse(file);

        // Server settings
        config.port = root.value("port", config.port);
        config.host = root.value("host", config.host);
        config.index_type = root.value("index_type", config.index_type);

        if (root.contains("graph")) {
            const auto& g = root["graph"];
            config.graph.nodes_path = g.value("nodes_path", config.graph.nodes_path);
            config.graph.edges_path = g.value("edges_path", config.graph.edges_path);
            config.graph.db_path = g.value("db_path", config.graph.db_path);
        }
        config.gazetteer_path = root.value("gazetteer_path", config.gazetteer_path);

        if (root.contains("geocoder")) {
            const auto& g = root["geocoder"];
            config.geocoder.base_url = g.value("base_url", config.geocoder.base_url);
            config.geocoder.country_suffix = g.value("country_suffix", config.geocoder.country_suffix);
            config.geocoder.user_agent = g.value("user_agent", config.geocoder.user_agent);
            config.geocoder.timeout_seconds = g.value("timeout_seconds", config.geocoder.timeout_seconds);
        }

        if (root.contains("translator")) {
            const auto& t = root["translator"];
            config.translator.base_url = t.value("base_url", config.translator.base_url);
            config.translator.model = t.value("model", config.translator.model);
            config.translator.api_key_env = t.value("api_key_env", config.translator.api_key_env);
            config.translator.target_language = t.value("target_language", config.translator.target_language);
            config.translator.timeout_seconds = t.value("timeout_seconds", config.translator.timeout_seconds);
        }

        // Planner heuristics
        auto& p = config.planner;
        p.region_code = root.value("region_code", p.region_code);
        p.avoid_radius_km = root.value("avoid_radius_km", p.avoid_radius_km);
        p.split_trip_hours = root.value("split_trip_hours", p.split_trip_hours);
        if (root.contains("weather")) {
            const auto& w = root["weather"];
            p.rain_latitude_threshold = w.value("latitude_threshold", p.rain_latitude_threshold);
            p.rain_delay_seconds = w.value("delay_seconds", p.rain_delay_seconds);
        }
        if (root.contains("fares")) {
            const auto& f = root["fares"];
            p.bus_fare_per_km = f.value("bus_per_km", p.bus_fare_per_km);
            p.taxi_fare_per_km = f.value("taxi_per_km", p.taxi_fare_per_km);
        }

        if (root.contains("local_names")) {
            config.local_names = root["local_names"].get<std::map<std::string, std::string>>();
        }

        std::cout << "Loaded config from: " << config_path << "\n";
        return true;

    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}
