/**
 * @file server.cpp
 * @brief HTTP server for the itinerary API using Crow framework.
 *
 * POST /route plans a city-to-city itinerary; the graph and collaborators
 * are loaded once at startup and shared by all request threads.
 */

#include "engine_services.hpp"
#include <crow.h>
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <iostream>

using json = nlohmann::json;

EngineConfig g_config;
EngineServices g_services;

namespace {

crow::response json_response(int code, const std::string& body) {
    crow::response resp(code, body);
    resp.set_header("Content-Type", "application/json");
    return resp;
}

crow::response error_response(int code, const std::string& error, const std::string& details) {
    json body = {{"error", error}, {"details", details}};
    return json_response(code, body.dump());
}

}  // namespace

int main(int argc, char* argv[]) {
    std::cout << "=== Itinerary Engine HTTP Server ===\n\n";

    // Parse command line args
    std::string config_path;
    std::string port_arg, nodes_arg, edges_arg, db_arg, gazetteer_arg, index_arg;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--port" && i + 1 < argc) {
            port_arg = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--db" && i + 1 < argc) {
            db_arg = argv[++i];
        } else if (arg == "--nodes" && i + 1 < argc) {
            nodes_arg = argv[++i];
        } else if (arg == "--edges" && i + 1 < argc) {
            edges_arg = argv[++i];
        } else if (arg == "--gazetteer" && i + 1 < argc) {
            gazetteer_arg = argv[++i];
        } else if (arg == "--index" && i + 1 < argc) {
            index_arg = argv[++i];
        } else if (arg == "--help") {
            std::cout << "Usage: itinerary_server [options]\n"
                      << "  --config PATH      Config file (JSON)\n"
                      << "  --port PORT        Server port (default: 8080)\n"
                      << "  --db PATH          DuckDB database file\n"
                      << "  --nodes PATH       Nodes CSV/Parquet file\n"
                      << "  --edges PATH       Edges CSV/Parquet file or directory\n"
                      << "  --gazetteer PATH   Populated places CSV\n"
                      << "  --index TYPE       Spatial index: h3 or rtree (default: h3)\n";
            return 0;
        }
    }

    // Config file first, then command line overrides
    if (!config_path.empty() && !load_config(config_path, g_config)) {
        return 2;
    }
    try {
        if (!port_arg.empty()) g_config.port = std::stoi(port_arg);
    } catch (const std::exception& e) {
        std::cerr << "Invalid --port '" << port_arg << "': " << e.what() << "\n";
        return 2;
    }
    if (!db_arg.empty()) g_config.graph.db_path = db_arg;
    if (!nodes_arg.empty()) g_config.graph.nodes_path = nodes_arg;
    if (!edges_arg.empty()) g_config.graph.edges_path = edges_arg;
    if (!gazetteer_arg.empty()) g_config.gazetteer_path = gazetteer_arg;
    if (!index_arg.empty()) g_config.index_type = index_arg;

    curl_global_init(CURL_GLOBAL_DEFAULT);

    if (!init_services(g_config, g_services)) {
        std::cerr << "Startup failed\n";
        curl_global_cleanup();
        return 2;
    }

    // Create Crow app
    crow::SimpleApp app;

    // ============================================================
    // WELCOME
    // ============================================================
    CROW_ROUTE(app, "/")([]() {
        json response = {
            {"message", "Bienvenue sur l'API de routage Bénin. Utilisez POST /route pour calculer un itinéraire."}
        };
        return json_response(200, response.dump());
    });

    // ============================================================
    // HEALTH ENDPOINT
    // ============================================================
    CROW_ROUTE(app, "/health")([]() {
        json response = {
            {"status", "healthy"},
            {"nodes", g_services.graph.node_count()},
            {"edges", g_services.graph.edge_count()},
            {"places", g_services.gazetteer.size()},
            {"index_type", g_config.index_type},
            {"spatial_index", g_services.graph.has_spatial_index()}
        };
        return json_response(200, response.dump());
    });

    // ============================================================
    // ROUTE
    // ============================================================
    CROW_ROUTE(app, "/route").methods("POST"_method)([](const crow::request& req) {
        auto start_time = std::chrono::high_resolution_clock::now();

        RouteRequest request;
        std::string problem;
        if (!parse_route_request(req.body, request, problem)) {
            return error_response(400, "Requête invalide", problem);
        }

        try {
            RouteResult result = g_services.planner->compute_route(request);
            auto response = route_result_to_json(result);

            auto end_time = std::chrono::high_resolution_clock::now();
            response["metrics"]["runtime_ms"] =
                std::chrono::duration<double, std::milli>(end_time - start_time).count();
            return json_response(200, response.dump());

        } catch (const RouteError& e) {
            int code = e.kind() == RouteError::Kind::Internal ? 500 : 400;
            return json_response(code, route_error_to_json(e).dump());
        } catch (const std::exception& e) {
            std::cerr << "Route request failed: " << e.what() << "\n";
            return error_response(500, "Erreur interne", e.what());
        }
    });

    std::cout << "\nStarting server on " << g_config.host << ":" << g_config.port << "\n";
    app.port(g_config.port).bindaddr(g_config.host).multithreaded().run();

    curl_global_cleanup();
    return 0;
}
