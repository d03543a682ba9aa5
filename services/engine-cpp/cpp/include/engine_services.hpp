/**
 * @file engine_services.hpp
 * @brief Wiring of the graph, collaborators and planner from a config.
 */

#pragma once

#include "engine_config.hpp"
#include "geocoding.hpp"
#include "road_graph.hpp"
#include "route_planner.hpp"
#include "translator.hpp"

#include <memory>

/**
 * @brief Everything a front end needs to answer route requests.
 *
 * Members are created by init_services() and stay immutable afterwards;
 * the planner keeps references into the other members, so the struct is
 * neither copied nor moved.
 */
struct EngineServices {
    EngineServices() = default;
    EngineServices(const EngineServices&) = delete;
    EngineServices& operator=(const EngineServices&) = delete;

    RoadGraph graph;
    GazetteerReverseGeocoder gazetteer;
    std::unique_ptr<Geocoder> geocoder;
    std::unique_ptr<Translator> translator;
    std::unique_ptr<RoutePlanner> planner;
};

/**
 * @brief Load the road graph named by @p source and build its spatial index.
 *
 * db_path is used when DuckDB support is built in, the node/edge files
 * otherwise.
 */
bool load_road_graph(const GraphSource& source, const std::string& index_type, RoadGraph& graph);

/**
 * @brief Load the graph and gazetteer and create the planner.
 * @return false if a required input is missing or unreadable
 */
bool init_services(const EngineConfig& config, EngineServices& services);
