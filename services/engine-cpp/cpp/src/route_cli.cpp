/**
 * @file route_cli.cpp
 * @brief Command line front end: plan one route and print it as JSON.
 *
 * Exit codes: 0 route printed, 1 request rejected, 2 startup or internal error.
 */

#include "engine_services.hpp"
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <iostream>

using json = nlohmann::json;

namespace {

// Sends std::cout to stderr for its lifetime
struct CoutToStderr {
    std::streambuf* saved;
    CoutToStderr() : saved(std::cout.rdbuf(std::cerr.rdbuf())) {}
    ~CoutToStderr() { std::cout.rdbuf(saved); }
    CoutToStderr(const CoutToStderr&) = delete;
    CoutToStderr& operator=(const CoutToStderr&) = delete;
};

int print_error(int code, const std::string& error, const std::string& details) {
    json body = {{"error", error}, {"details", details}};
    std::cout << body.dump(2) << "\n";
    return code;
}

void print_usage() {
    std::cout << "Usage: itinerary_cli --start NAME --end NAME [options]\n"
              << "  --start NAME       Departure place\n"
              << "  --end NAME         Destination place\n"
              << "  --avoid NAME       Place to keep away from\n"
              << "  --season S         dry or rain (default: dry)\n"
              << "  --weight W         duration or distance (default: duration)\n"
              << "  --config PATH      Config file (JSON)\n"
              << "  --nodes PATH       Nodes CSV/Parquet file\n"
              << "  --edges PATH       Edges CSV/Parquet file or directory\n"
              << "  --db PATH          DuckDB database file\n"
              << "  --gazetteer PATH   Populated places CSV\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    EngineConfig config;
    RouteRequest request;
    std::string config_path, season = "dry", weight = "duration";
    std::string nodes_arg, edges_arg, db_arg, gazetteer_arg;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--start" && i + 1 < argc) {
            request.start = argv[++i];
        } else if (arg == "--end" && i + 1 < argc) {
            request.end = argv[++i];
        } else if (arg == "--avoid" && i + 1 < argc) {
            request.avoid = argv[++i];
        } else if (arg == "--season" && i + 1 < argc) {
            season = argv[++i];
        } else if (arg == "--weight" && i + 1 < argc) {
            weight = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--nodes" && i + 1 < argc) {
            nodes_arg = argv[++i];
        } else if (arg == "--edges" && i + 1 < argc) {
            edges_arg = argv[++i];
        } else if (arg == "--db" && i + 1 < argc) {
            db_arg = argv[++i];
        } else if (arg == "--gazetteer" && i + 1 < argc) {
            gazetteer_arg = argv[++i];
        } else if (arg == "--help") {
            print_usage();
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage();
            return 1;
        }
    }

    if (request.start.empty() || request.end.empty()) {
        return print_error(1, "Requête invalide", "--start and --end are required");
    }
    if (!parse_season(season, request.season)) {
        return print_error(1, "Requête invalide", "unknown season '" + season + "'");
    }
    if (!parse_weight_field(weight, request.weight)) {
        return print_error(1, "Requête invalide", "unknown weight '" + weight + "'");
    }

    curl_global_init(CURL_GLOBAL_DEFAULT);
    EngineServices services;
    bool ready = false;
    try {
        // Progress goes to stderr so stdout holds only the JSON document
        CoutToStderr progress_to_stderr;
        ready = config_path.empty() || load_config(config_path, config);
        if (!db_arg.empty()) config.graph.db_path = db_arg;
        if (!nodes_arg.empty()) config.graph.nodes_path = nodes_arg;
        if (!edges_arg.empty()) config.graph.edges_path = edges_arg;
        if (!gazetteer_arg.empty()) config.gazetteer_path = gazetteer_arg;
        ready = ready && init_services(config, services);
    } catch (const std::exception& e) {
        curl_global_cleanup();
        return print_error(2, "Erreur interne", e.what());
    }

    int code = 0;
    if (!ready) {
        code = print_error(2, "Erreur interne", "startup failed");
    } else {
        try {
            RouteResult result = services.planner->compute_route(request);
            std::cout << route_result_to_json(result).dump(2) << "\n";
        } catch (const RouteError& e) {
            code = e.kind() == RouteError::Kind::Internal ? 2 : 1;
            std::cout << route_error_to_json(e).dump(2) << "\n";
        } catch (const std::exception& e) {
            code = print_error(2, "Erreur interne", e.what());
        }
    }

    curl_global_cleanup();
    return code;
}
