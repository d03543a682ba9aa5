/**
 * @file engine_services.cpp
 * @brief Service initialization shared by the server and the CLI.
 */

#include "engine_services.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>

bool load_road_graph(const GraphSource& source, const std::string& index_type, RoadGraph& graph) {
    std::cout << "Loading graph...\n";

#ifdef HAVE_DUCKDB
    if (!source.db_path.empty()) {
        std::cout << "  Database: " << source.db_path << "\n";
        if (!graph.load_from_duckdb(source.db_path)) {
            std::cerr << "  Failed to load from DuckDB\n";
            return false;
        }
    } else
#endif
    {
        if (source.nodes_path.empty() || source.edges_path.empty()) {
            std::cerr << "  nodes_path and edges_path are required\n";
            return false;
        }
        std::cout << "  Nodes: " << source.nodes_path << "\n";
        if (!graph.load_nodes(source.nodes_path)) {
            std::cerr << "  Failed to load nodes\n";
            return false;
        }
        std::cout << "  Edges: " << source.edges_path << "\n";
        if (!graph.load_edges(source.edges_path)) {
            std::cerr << "  Failed to load edges\n";
            return false;
        }
    }

    std::cout << "  Building spatial index (" << index_type << ")...\n";
    if (index_type == "rtree") {
        graph.build_spatial_index(SpatialIndexType::RTREE);
    } else {
        graph.build_spatial_index(SpatialIndexType::H3);
    }

    std::cout << "  Graph loaded: " << graph.node_count() << " nodes, "
              << graph.edge_count() << " edges\n";
    return true;
}

bool init_services(const EngineConfig& config, EngineServices& services) {
    try {
        if (!load_road_graph(config.graph, config.index_type, services.graph)) {
            return false;
        }

        if (config.gazetteer_path.empty()) {
            std::cerr << "gazetteer_path is required\n";
            return false;
        }
        std::cout << "Loading gazetteer: " << config.gazetteer_path << "\n";
        if (!services.gazetteer.load(config.gazetteer_path)) {
            std::cerr << "  Failed to load gazetteer\n";
            return false;
        }

        services.geocoder = std::make_unique<NominatimGeocoder>(config.geocoder);

        std::string api_key;
        if (const char* env = std::getenv(config.translator.api_key_env.c_str())) {
            api_key = env;
        }
        if (api_key.empty()) {
            std::cout << "No " << config.translator.api_key_env << " set, translation disabled\n";
        }
        services.translator = std::make_unique<GeminiTranslator>(config.translator, api_key);

        services.planner = std::make_unique<RoutePlanner>(
            services.graph, *services.geocoder, services.gazetteer, *services.translator,
            config.planner, PlaceNameLocalizer(config.local_names), config.geocoder.country_suffix);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Startup error: " << e.what() << "\n";
        return false;
    }
}
