/**
 * @file route_planner.cpp
 * @brief Itinerary planning: geocoding, search and narrative assembly.
 */

#include "route_planner.hpp"
#include "exclusion_filter.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {

std::string format_fixed(double value, int precision) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(precision) << value;
    return os.str();
}

std::string format_leg(const Leg& leg) {
    return leg.name + " - " + format_fixed(leg.distance_km, 1) + "km";
}

std::string describe_place(const PlaceInfo& place) {
    return "(" + place.name + ", " + place.country_code + ")";
}

}  // namespace

// ============================================================
// SEASON
// ============================================================

bool parse_season(const std::string& text, Season& out) {
    std::string s = to_lower_ascii(text);
    if (s == "dry") {
        out = Season::Dry;
        return true;
    }
    if (s == "rain") {
        out = Season::Rain;
        return true;
    }
    return false;
}

const char* season_label(Season season) {
    return season == Season::Rain ? "Saison des Pluies" : "Saison Sèche";
}

// ============================================================
// REQUEST BODY
// ============================================================

// Optional string member; absent or null keeps the fallback
static bool optional_string(const nlohmann::json& body, const char* key,
                            std::string& out, std::string& problem) {
    auto it = body.find(key);
    if (it == body.end() || it->is_null()) return true;
    if (!it->is_string()) {
        problem = std::string("'") + key + "' must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool parse_route_request(const std::string& text, RouteRequest& request, std::string& problem) {
    nlohmann::json body = nlohmann::json::parse(text, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        problem = "body must be a JSON object";
        return false;
    }
    if (!body.contains("start") || !body["start"].is_string() ||
        !body.contains("end") || !body["end"].is_string()) {
        problem = "'start' and 'end' are required strings";
        return false;
    }
    request.start = body["start"].get<std::string>();
    request.end = body["end"].get<std::string>();

    std::string season = "dry";
    std::string weight = "duration";
    if (!optional_string(body, "avoid", request.avoid, problem) ||
        !optional_string(body, "season", season, problem) ||
        !optional_string(body, "weight", weight, problem)) {
        return false;
    }

    if (!parse_season(season, request.season)) {
        problem = "unknown season '" + season + "' (dry or rain)";
        return false;
    }
    if (!parse_weight_field(weight, request.weight)) {
        problem = "unknown weight '" + weight + "' (duration or distance)";
        return false;
    }
    return true;
}

// ============================================================
// PLANNER
// ============================================================

RoutePlanner::RoutePlanner(const RoadGraph& graph,
                           const Geocoder& geocoder,
                           const ReverseGeocoder& reverse_geocoder,
                           const Translator& translator,
                           PlannerConfig config,
                           PlaceNameLocalizer localizer,
                           std::string country_suffix)
    : graph_(graph),
      geocoder_(geocoder),
      reverse_geocoder_(reverse_geocoder),
      translator_(translator),
      config_(std::move(config)),
      localizer_(std::move(localizer)),
      country_suffix_(std::move(country_suffix)) {}

std::optional<Coordinate> RoutePlanner::smart_geocode(const std::string& query) const {
    if (auto coord = geocoder_.resolve_place(query)) return coord;
    if (country_suffix_.empty()) return std::nullopt;
    return geocoder_.resolve_place(query + ", " + country_suffix_);
}

std::string RoutePlanner::translate_or_keep(const std::string& text) const {
    auto translated = translator_.translate(text);
    if (!translated || translated->empty()) return text;
    return *translated;
}

std::string RoutePlanner::build_summary(const RouteResult& result) const {
    double km = result.metrics.distance_m / 1000.0;
    double time_s = result.metrics.time_s + result.weather_delay_s;
    long long hours = static_cast<long long>(std::floor(time_s / 3600.0));
    long long minutes = static_cast<long long>(std::floor(std::fmod(time_s, 3600.0) / 60.0));

    std::ostringstream os;
    os << "Total: " << format_fixed(km, 0) << "km, ~" << hours << "h"
       << std::setw(2) << std::setfill('0') << minutes;
    if (result.weather_degraded) {
        os << " | [Météo] Route dégradée (+"
           << static_cast<long long>(result.weather_delay_s / 60.0) << "min)";
    }
    os << " | Bus: ~" << result.bus_fare << "F / Taxi: ~" << result.taxi_fare << "F";
    if (hours >= config_.split_trip_hours) {
        os << " | Suggestion: découper en 2 jours";
    }
    return os.str();
}

RouteResult RoutePlanner::compute_route(const RouteRequest& request, const CancelCheck& cancel) const {
    if (to_lower_ascii(request.start) == to_lower_ascii(request.end)) {
        throw RouteError(RouteError::Kind::Input,
                         "Origine et destination identiques (" + request.start + ")");
    }

    // Endpoints
    auto start_pt = smart_geocode(request.start);
    if (!start_pt) {
        throw RouteError(RouteError::Kind::Input, "Lieu introuvable", "cannot geocode '" + request.start + "'");
    }
    auto end_pt = smart_geocode(request.end);
    if (!end_pt) {
        throw RouteError(RouteError::Kind::Input, "Lieu introuvable", "cannot geocode '" + request.end + "'");
    }

    auto endpoints = reverse_geocoder_.reverse_resolve({*start_pt, *end_pt});
    if (!endpoints || endpoints->size() != 2) {
        throw RouteError(RouteError::Kind::Input, "Lieu introuvable", "reverse geocoding failed");
    }
    const PlaceInfo& start_place = (*endpoints)[0];
    const PlaceInfo& end_place = (*endpoints)[1];
    if (start_place.country_code != config_.region_code) {
        throw RouteError(RouteError::Kind::Input,
                         "Départ incorrect " + describe_place(start_place),
                         "La zone de couverture est EXCLUSIVEMENT le BÉNIN.");
    }
    if (end_place.country_code != config_.region_code) {
        throw RouteError(RouteError::Kind::Input,
                         "Destination hors zone " + describe_place(end_place),
                         "Trajet impossible : Le calculateur ne gère que les routes internes.");
    }

    auto start_node = graph_.nearest_node(start_pt->lat, start_pt->lon);
    auto end_node = graph_.nearest_node(end_pt->lat, end_pt->lon);
    if (!start_node || !end_node) {
        throw RouteError(RouteError::Kind::Internal, "Erreur interne", "road graph is empty");
    }

    ExclusionSet excluded;
    if (!request.avoid.empty()) {
        std::string query = request.avoid;
        if (!country_suffix_.empty()) query += ", " + country_suffix_;
        excluded = build_exclusion_set(graph_, geocoder_, query, config_.avoid_radius_km);
    }

    // Search
    SearchResult search = bidirectional_dijkstra(graph_, *start_node, *end_node,
                                                 request.weight, excluded, cancel);
    switch (search.status) {
        case SearchStatus::Found:
            break;
        case SearchStatus::NoPath:
            throw RouteError(RouteError::Kind::NoPath, "Aucun chemin trouvé", search.error);
        case SearchStatus::NodeNotFound:
        case SearchStatus::Cancelled:
            throw RouteError(RouteError::Kind::Internal, "Erreur interne",
                             std::string(search_status_name(search.status)) + ": " + search.error);
    }

    RouteResult result;
    result.weight = request.weight;
    result.cost = search.cost;
    result.node_count = search.path.size();
    result.excluded_nodes = excluded.size();
    result.settled_nodes = search.settled;

    try {
        result.metrics = compute_path_metrics(graph_, search.path);

        // Narrative
        std::vector<Coordinate> coords;
        coords.reserve(search.path.size());
        double lat_max = -90.0;
        for (NodeId id : search.path) {
            Coordinate c = graph_.coordinate_of(id);
            lat_max = std::max(lat_max, c.lat);
            coords.push_back(c);
        }

        double remaining_m = result.metrics.distance_m;
        auto places = reverse_geocoder_.reverse_resolve(coords);
        if (places && places->size() == coords.size()) {
            Segmentation seg = segment_route(graph_, search.path, *places, config_.region_code);
            for (auto& leg : seg.legs) {
                result.steps.push_back({localizer_.render(leg.name), leg.distance_km});
            }
            remaining_m = seg.remaining_m;
        } else {
            std::cerr << "Warning: path reverse geocoding failed, no intermediate steps\n";
        }

        result.departure = localizer_.render(title_case(request.start));
        result.destination = {localizer_.render(title_case(request.end)), remaining_m / 1000.0};
        if (!request.avoid.empty()) {
            result.avoid_city = localizer_.render(title_case(request.avoid));
        }

        if (request.season == Season::Rain && lat_max > config_.rain_latitude_threshold) {
            result.weather_degraded = true;
            result.weather_delay_s = config_.rain_delay_seconds;
        }
    } catch (const GraphError& e) {
        throw RouteError(RouteError::Kind::Internal, "Erreur interne", e.what());
    }

    double km = result.metrics.distance_m / 1000.0;
    result.bus_fare = static_cast<long long>(km * config_.bus_fare_per_km);
    result.taxi_fare = static_cast<long long>(km * config_.taxi_fare_per_km);

    result.season_source = season_label(request.season);
    result.season = translate_or_keep(result.season_source);
    result.summary_source = build_summary(result);
    result.summary = translate_or_keep(result.summary_source);

    return result;
}

// ============================================================
// JSON
// ============================================================

nlohmann::ordered_json route_result_to_json(const RouteResult& result) {
    nlohmann::ordered_json out;
    out["departure"] = result.departure;
    for (size_t i = 0; i < result.steps.size(); ++i) {
        out["step_" + std::to_string(i + 1)] = format_leg(result.steps[i]);
    }
    out["destination"] = format_leg(result.destination);
    if (result.avoid_city) out["avoid_city"] = *result.avoid_city;
    out["season"] = result.season;
    out["info_sup"] = result.summary;

    out["metrics"] = {
        {"distance_km", result.metrics.distance_m / 1000.0},
        {"duration_s", result.metrics.time_s + result.weather_delay_s},
        {"weight", weight_field_name(result.weight)},
        {"cost", result.cost},
        {"weather_delay_s", result.weather_delay_s},
        {"bus_fare", result.bus_fare},
        {"taxi_fare", result.taxi_fare},
        {"path_nodes", result.node_count},
        {"excluded_nodes", result.excluded_nodes},
        {"settled_nodes", result.settled_nodes},
        {"season", result.season_source},
        {"info_sup", result.summary_source}
    };
    return out;
}

nlohmann::json route_error_to_json(const RouteError& error) {
    nlohmann::json out = {{"error", error.what()}};
    out["details"] = error.details().empty() ? nlohmann::json(nullptr) : nlohmann::json(error.details());
    return out;
}
