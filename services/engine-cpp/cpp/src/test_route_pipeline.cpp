/**
 * @file test_route_pipeline.cpp
 * @brief Tests for everything around the search: exclusion zones,
 * segmentation, table loading, place names, config and the route planner.
 *
 * Usage:
 *   ./build/test_route_pipeline [--verbose]
 *
 * The planner runs against in-process geocoder and translator doubles and
 * a real gazetteer, so no network access is needed.
 */

#include "engine_config.hpp"
#include "engine_services.hpp"
#include "exclusion_filter.hpp"
#include "place_names.hpp"
#include "route_planner.hpp"
#include "segmentation.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <random>
#include <stdexcept>
#include <vector>

namespace fs = std::filesystem;

struct TestResult {
    int total = 0;
    int passed = 0;
    int mismatches = 0;
};

static bool g_verbose = false;

static void check(TestResult& result, bool ok, const std::string& name) {
    result.total++;
    if (ok) {
        result.passed++;
        if (g_verbose) std::cout << "  ok  " << name << "\n";
    } else {
        result.mismatches++;
        std::cerr << "MISMATCH: " << name << "\n";
    }
}

static bool near(double a, double b) {
    return std::abs(a - b) < 1e-9;
}

static fs::path write_temp(const std::string& name, const std::string& content) {
    fs::path path = fs::temp_directory_path() / ("itinerary_test_" + name);
    std::ofstream out(path);
    out << content;
    return path;
}

// ============================================================
// TEST DOUBLES
// ============================================================

class FakeGeocoder : public Geocoder {
public:
    void add(const std::string& name, double lat, double lon) {
        places_[to_lower_ascii(name)] = Coordinate{lat, lon};
    }

    std::optional<Coordinate> resolve_place(const std::string& name) const override {
        queries.push_back(name);
        auto it = places_.find(to_lower_ascii(name));
        if (it == places_.end()) return std::nullopt;
        return it->second;
    }

    mutable std::vector<std::string> queries;

private:
    std::map<std::string, Coordinate> places_;
};

class FakeTranslator : public Translator {
public:
    explicit FakeTranslator(std::string prefix = {}) : prefix_(std::move(prefix)) {}

    // Empty prefix behaves like an unavailable service
    std::optional<std::string> translate(const std::string& text) const override {
        if (prefix_.empty()) return std::nullopt;
        return prefix_ + text;
    }

private:
    std::string prefix_;
};

// Answers the two-point endpoint lookup but fails on whole paths
class EndpointsOnlyReverseGeocoder : public ReverseGeocoder {
public:
    explicit EndpointsOnlyReverseGeocoder(const ReverseGeocoder& inner) : inner_(inner) {}

    std::optional<std::vector<PlaceInfo>> reverse_resolve(
        const std::vector<Coordinate>& coords) const override {
        if (coords.size() != 2) return std::nullopt;
        return inner_.reverse_resolve(coords);
    }

private:
    const ReverseGeocoder& inner_;
};

// ============================================================
// EXCLUSION FILTER
// ============================================================

static void test_exclusion(TestResult& result) {
    RoadGraph graph;
    graph.add_node(1, 6.50, 2.50);   // center
    graph.add_node(2, 6.52, 2.50);   // 2.2 km north
    graph.add_node(3, 6.53, 2.50);   // 3.3 km north
    graph.add_node(4, 6.50, 2.52);   // 0.02 deg east
    graph.add_node(5, 6.52, 2.52);   // 0.028 deg diagonal

    ExclusionSet zone = nodes_within_radius(graph, {6.5, 2.5}, 3.0);
    check(result, zone == ExclusionSet({1, 2, 4}), "nodes within 3 km");

    check(result, nodes_within_radius(graph, {6.5, 2.5}, 0.0).empty(), "zero radius excludes nothing");
    check(result, nodes_within_radius(graph, {0.0, 0.0}, 3.0).empty(), "far center excludes nothing");

    // The radius is measured in degrees: at 60N a node 1.7 km east stays outside a 3 km zone
    RoadGraph north;
    north.add_node(1, 60.0, 10.03);
    north.add_node(2, 60.02, 10.0);
    ExclusionSet north_zone = nodes_within_radius(north, {60.0, 10.0}, 3.0);
    check(result, north_zone == ExclusionSet({2}), "degree radius at high latitude");

    FakeGeocoder geocoder;
    geocoder.add("Center, Benin", 6.5, 2.5);
    check(result, build_exclusion_set(graph, geocoder, "Center, Benin", 3.0).size() == 3,
          "exclusion around a geocoded place");
    check(result, build_exclusion_set(graph, geocoder, "Nowhere", 3.0).empty(),
          "unknown place excludes nothing");
}

// ============================================================
// SEGMENTATION
// ============================================================

static RoadGraph chain_graph(int nodes, double length) {
    RoadGraph graph;
    for (int i = 1; i <= nodes; ++i) graph.add_node(i, 6.0 + 0.01 * i, 2.0);
    for (int i = 1; i < nodes; ++i) {
        EdgeVariant v;
        v.length = length;
        v.travel_time = length / 10.0;
        graph.add_edge(i, i + 1, v);
    }
    return graph;
}

static void test_segmentation(TestResult& result) {
    RoadGraph graph = chain_graph(6, 1000.0);
    std::vector<NodeId> path = {1, 2, 3, 4, 5, 6};
    std::vector<PlaceInfo> places = {
        {"Cotonou", "BJ"}, {"Cotonou", "BJ"}, {"Abomey-Calavi", "BJ"},
        {"Lome", "TG"}, {"Allada", "BJ"}, {"Bohicon", "BJ"},
    };

    Segmentation seg = segment_route(graph, path, places, "BJ");
    check(result, seg.legs.size() == 2, "two intermediate legs");
    if (seg.legs.size() == 2) {
        check(result, seg.legs[0].name == "Abomey-Calavi" && near(seg.legs[0].distance_km, 2.0),
              "first leg covers the repeated place");
        check(result, seg.legs[1].name == "Allada" && near(seg.legs[1].distance_km, 2.0),
              "foreign place adds distance without a leg");
    }
    check(result, near(seg.remaining_m, 1000.0), "remaining distance goes to the destination");
    check(result, seg.final_place == "Bohicon", "final place");

    Segmentation again = segment_route(graph, path, places, "BJ");
    bool same = again.legs.size() == seg.legs.size() && again.remaining_m == seg.remaining_m &&
                again.final_place == seg.final_place;
    for (size_t i = 0; same && i < seg.legs.size(); ++i) {
        same = again.legs[i].name == seg.legs[i].name && again.legs[i].distance_km == seg.legs[i].distance_km;
    }
    check(result, same, "segmentation is deterministic");

    // Final place is the last in-region one even if the path ends abroad
    std::vector<PlaceInfo> abroad = {
        {"Cotonou", "BJ"}, {"Ouidah", "BJ"}, {"Ouidah", "BJ"},
        {"Allada", "BJ"}, {"Lome", "TG"}, {"Lome", "TG"},
    };
    Segmentation tail = segment_route(graph, path, abroad, "BJ");
    check(result, tail.final_place == "Allada" && tail.legs.size() == 1 &&
                      tail.legs[0].name == "Ouidah" && near(tail.remaining_m, 4000.0),
          "trailing foreign places fold into the destination");

    std::vector<PlaceInfo> nowhere(6, PlaceInfo{"Lome", "TG"});
    Segmentation outside = segment_route(graph, path, nowhere, "BJ");
    check(result, outside.final_place == "Lome" && outside.legs.empty() && near(outside.remaining_m, 5000.0),
          "no in-region place");

    // Revisiting a place opens a new leg
    RoadGraph four = chain_graph(4, 1000.0);
    std::vector<PlaceInfo> back_and_forth = {{"A", "BJ"}, {"B", "BJ"}, {"A", "BJ"}, {"C", "BJ"}};
    Segmentation revisit = segment_route(four, {1, 2, 3, 4}, back_and_forth, "BJ");
    check(result, revisit.legs.size() == 2 && revisit.legs[0].name == "B" && revisit.legs[1].name == "A",
          "revisited place");

    // Step lengths use the shortest variant
    RoadGraph multi = chain_graph(2, 1000.0);
    EdgeVariant shorter;
    shorter.length = 400.0;
    shorter.travel_time = 500.0;
    multi.add_edge(1, 2, shorter);
    Segmentation shortest = segment_route(multi, {1, 2}, {{"A", "BJ"}, {"B", "BJ"}}, "BJ");
    check(result, near(shortest.remaining_m, 400.0), "shortest variant length");

    Segmentation single = segment_route(graph, {1}, {{"Cotonou", "BJ"}}, "BJ");
    check(result, single.legs.empty() && single.remaining_m == 0.0 && single.final_place == "Cotonou",
          "single node path");

    bool threw = false;
    try {
        segment_route(graph, path, {{"Cotonou", "BJ"}}, "BJ");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    check(result, threw, "place count must match the path");

    threw = false;
    try {
        segment_route(graph, {1, 3}, {{"A", "BJ"}, {"B", "BJ"}}, "BJ");
    } catch (const GraphError&) {
        threw = true;
    }
    check(result, threw, "missing edge is a graph error");
}

// ============================================================
// TABLE LOADING
// ============================================================

static void test_loading(TestResult& result) {
    fs::path nodes = write_temp("nodes.csv",
                                "osmid,y,x,street_count\n"
                                "1,6.37,2.42,3\n"
                                "2,6.66,2.16,2\n"
                                "3,bad,2.0,1\n");
    fs::path edges = write_temp("edges.csv",
                                "u,v,key,length,travel_time,name\n"
                                "1,2,0,35000,1800,RNIE2\n"
                                "2,1,0,35000,,\"['RNIE2', 'Route des Pêches']\"\n"
                                "1,2,1,36000,1700,\n"
                                "1,9,0,10,10,Nowhere\n");

    RoadGraph graph;
    check(result, graph.load_nodes(nodes.string()), "nodes CSV loads");
    check(result, graph.node_count() == 2, "malformed node row skipped");
    check(result, graph.load_edges(edges.string()), "edges CSV loads");
    check(result, graph.edge_count() == 3 && graph.bundle_count() == 2, "edge to unknown node skipped");

    const EdgeBundle* back = graph.find_bundle(2, 1);
    check(result, back && back->variants.size() == 1 && std::isinf(back->variants[0].travel_time),
          "empty travel time is unknown");
    check(result, back && back->variants[0].names == std::vector<std::string>({"RNIE2", "Route des Pêches"}),
          "name lists parsed");

    const EdgeBundle* forward = graph.find_bundle(1, 2);
    check(result, forward && forward->variants.size() == 2, "parallel edges bundled");
    if (forward) {
        check(result, min_weight(*forward, WeightField::TravelTime) == 1700.0 &&
                          min_weight(*forward, WeightField::Length) == 35000.0,
              "bundle minimum per field");
    }

    check(result, !graph.load_nodes((fs::temp_directory_path() / "itinerary_missing.csv").string()),
          "missing nodes file");

    bool threw = false;
    try {
        graph.coordinate_of(42);
    } catch (const GraphError&) {
        threw = true;
    }
    check(result, threw, "unknown node coordinate");

    fs::path places = write_temp("places.csv",
                                 "lat,lon,name,admin1,cc\n"
                                 "6.37,2.42,Cotonou,Littoral,BJ\n"
                                 "6.13,1.22,Lome,Maritime,TG\n"
                                 "x,1.0,Broken,None,BJ\n");
    GazetteerReverseGeocoder gazetteer;
    check(result, gazetteer.load(places.string()) && gazetteer.size() == 2, "gazetteer CSV loads");

    auto found = gazetteer.reverse_resolve({{6.36, 2.40}, {6.2, 1.3}});
    check(result, found && found->size() == 2 && (*found)[0].name == "Cotonou" &&
                      (*found)[1].name == "Lome" && (*found)[1].country_code == "TG",
          "reverse geocoding picks the nearest place");

    GazetteerReverseGeocoder empty;
    check(result, !empty.reverse_resolve({{6.0, 2.0}}), "empty gazetteer fails");

    // A name too long for the filesystem makes stat() fail outright
    GraphSource unusable;
    unusable.nodes_path = std::string(5000, 'n');
    unusable.edges_path = edges.string();
    bool loaded = true;
    try {
        RoadGraph scratch;
        loaded = load_road_graph(unusable, "h3", scratch);
    } catch (const std::exception& e) {
        std::cerr << "  load_road_graph threw: " << e.what() << "\n";
    }
    check(result, !loaded, "unusable nodes path reported as a failed load");

    EngineConfig startup;
    startup.graph = unusable;
    startup.gazetteer_path = places.string();
    bool started = true;
    try {
        EngineServices services;
        started = init_services(startup, services);
    } catch (const std::exception& e) {
        std::cerr << "  init_services threw: " << e.what() << "\n";
    }
    check(result, !started, "startup failure returned, not thrown");

    fs::remove(nodes);
    fs::remove(edges);
    fs::remove(places);
}

// ============================================================
// PLACE NAMES AND CONFIG
// ============================================================

static void test_names_and_config(TestResult& result) {
    check(result, title_case("porto-novo") == "Porto-Novo", "title case after hyphen");
    check(result, title_case("ABOMEY calavi") == "Abomey Calavi", "title case lowers the rest");
    check(result, title_case("côte d'ivoire") == "Côte D'Ivoire", "title case keeps accented words whole");
    check(result, to_lower_ascii("BoHiCoN") == "bohicon", "lowercase");

    PlaceNameLocalizer localizer(EngineConfig::default_local_names());
    check(result, localizer.render("cotonou") == "Kutɔnu (Cotonou)", "local name ignores case");
    check(result, localizer.render("Bohicon, Benin") == "Bɔxikɔn (Bohicon)", "local name ignores suffix");
    check(result, localizer.render(" Ouidah ") == "Glexwé (Ouidah)", "local name ignores padding");
    check(result, localizer.render("Parakou") == "Parakou", "unknown name unchanged");
    check(result, PlaceNameLocalizer().render("Cotonou") == "Cotonou", "empty table");

    Season season = Season::Dry;
    check(result, parse_season("RAIN", season) && season == Season::Rain, "season parse");
    check(result, !parse_season("monsoon", season), "unknown season");
    check(result, std::string(season_label(Season::Dry)) == "Saison Sèche", "dry label");

    WeightField field = WeightField::TravelTime;
    check(result, parse_weight_field("distance", field) && field == WeightField::Length, "weight parse");
    check(result, !parse_weight_field("scenic", field), "unknown weight");

    fs::path config_file = write_temp("config.json", R"({
        "port": 9090,
        "index_type": "rtree",
        "graph": {"nodes_path": "data/nodes.csv"},
        "weather": {"latitude_threshold": 9.0},
        "fares": {"bus_per_km": 20},
        "local_names": {"Parakou": "Parakú"}
    })");
    EngineConfig config;
    check(result, load_config(config_file.string(), config), "config loads");
    check(result, config.port == 9090 && config.index_type == "rtree" &&
                      config.graph.nodes_path == "data/nodes.csv" && config.graph.edges_path.empty(),
          "config server keys");
    check(result, config.planner.rain_latitude_threshold == 9.0 && config.planner.rain_delay_seconds == 1800.0,
          "config weather keys");
    check(result, config.planner.bus_fare_per_km == 20.0 && config.planner.taxi_fare_per_km == 30.0,
          "config fares keep defaults");
    check(result, config.local_names.size() == 1 && config.local_names["Parakou"] == "Parakú",
          "config local names replace the table");

    fs::path broken = write_temp("broken.json", "{ not json");
    EngineConfig untouched;
    check(result, !load_config(broken.string(), untouched) && untouched.port == 8080, "malformed config");
    check(result, !load_config((fs::temp_directory_path() / "itinerary_missing.json").string(), untouched),
          "missing config");

    fs::remove(config_file);
    fs::remove(broken);
}

// ============================================================
// ROUTE PLANNER
// ============================================================

static void add_two_way(RoadGraph& graph, NodeId a, NodeId b, double length, double seconds) {
    EdgeVariant v;
    v.length = length;
    v.travel_time = seconds;
    graph.add_edge(a, b, v);
    graph.add_edge(b, a, v);
}

// Cotonou -> Parakou through Allada, Bohicon and Dassa, with a longer
// bypass of Bohicon through node 6 and an isolated Natitingou
static RoadGraph benin_graph() {
    RoadGraph graph;
    graph.add_node(1, 6.37, 2.42);    // Cotonou
    graph.add_node(2, 6.66, 2.16);    // Allada
    graph.add_node(3, 7.18, 2.08);    // Bohicon
    graph.add_node(4, 7.75, 2.18);    // Dassa
    graph.add_node(5, 9.34, 2.63);    // Parakou
    graph.add_node(6, 7.00, 2.50);    // bypass near Zagnanado
    graph.add_node(7, 10.30, 1.38);   // Natitingou
    add_two_way(graph, 1, 2, 35000, 1800);
    add_two_way(graph, 2, 3, 60000, 3000);
    add_two_way(graph, 3, 4, 65000, 3300);
    add_two_way(graph, 4, 5, 180000, 9000);
    add_two_way(graph, 2, 6, 50000, 3000);
    add_two_way(graph, 6, 4, 70000, 3800);
    return graph;
}

static void benin_gazetteer(GazetteerReverseGeocoder& gazetteer) {
    gazetteer.add_place({"Cotonou", "BJ"}, {6.37, 2.42});
    gazetteer.add_place({"Allada", "BJ"}, {6.66, 2.16});
    gazetteer.add_place({"Bohicon", "BJ"}, {7.18, 2.08});
    gazetteer.add_place({"Dassa", "BJ"}, {7.75, 2.18});
    gazetteer.add_place({"Parakou", "BJ"}, {9.34, 2.63});
    gazetteer.add_place({"Zagnanado", "BJ"}, {7.22, 2.40});
    gazetteer.add_place({"Natitingou", "BJ"}, {10.30, 1.38});
    gazetteer.add_place({"Lome", "TG"}, {6.13, 1.22});
}

static void benin_geocoder(FakeGeocoder& geocoder) {
    geocoder.add("Cotonou", 6.37, 2.42);
    geocoder.add("Parakou", 9.34, 2.63);
    geocoder.add("Bohicon, Benin", 7.18, 2.08);
    geocoder.add("Lome", 6.13, 1.22);
    geocoder.add("Natitingou, Benin", 10.30, 1.38);
}

static RouteRequest request(const std::string& start, const std::string& end, const std::string& avoid = {}) {
    RouteRequest req;
    req.start = start;
    req.end = end;
    req.avoid = avoid;
    return req;
}

static bool fails_with(const RoutePlanner& planner, const RouteRequest& req, RouteError::Kind kind,
                       const std::string& message = {}) {
    try {
        planner.compute_route(req);
    } catch (const RouteError& e) {
        return e.kind() == kind && (message.empty() || message == e.what());
    }
    return false;
}

static void test_planner(TestResult& result) {
    RoadGraph graph = benin_graph();
    graph.build_spatial_index(SpatialIndexType::RTREE);

    GazetteerReverseGeocoder gazetteer;
    benin_gazetteer(gazetteer);
    FakeGeocoder geocoder;
    benin_geocoder(geocoder);
    FakeTranslator no_translation;
    PlaceNameLocalizer localizer(EngineConfig::default_local_names());

    RoutePlanner planner(graph, geocoder, gazetteer, no_translation, PlannerConfig{}, localizer, "Benin");

    // Fastest route goes through Bohicon
    RouteResult r = planner.compute_route(request("cotonou", "Parakou"));
    check(result, r.departure == "Kutɔnu (Cotonou)", "departure rendered with local name");
    check(result, r.steps.size() == 3, "three intermediate steps");
    if (r.steps.size() == 3) {
        check(result, r.steps[0].name == "Alada (Allada)" && near(r.steps[0].distance_km, 35.0), "step 1");
        check(result, r.steps[1].name == "Bɔxikɔn (Bohicon)" && near(r.steps[1].distance_km, 60.0), "step 2");
        check(result, r.steps[2].name == "Dassa" && near(r.steps[2].distance_km, 65.0), "step 3");
    }
    check(result, r.destination.name == "Parakou" && near(r.destination.distance_km, 180.0), "destination leg");
    check(result, near(r.metrics.distance_m, 340000.0) && near(r.metrics.time_s, 17100.0), "route metrics");
    check(result, r.bus_fare == 6120 && r.taxi_fare == 10200, "fares");
    check(result, r.summary_source == "Total: 340km, ~4h45 | Bus: ~6120F / Taxi: ~10200F", "summary line");
    check(result, r.summary == r.summary_source && r.season == "Saison Sèche",
          "untranslated text kept when translation is unavailable");
    check(result, !r.avoid_city && r.excluded_nodes == 0 && r.node_count == 5, "no avoided city");

    auto doc = route_result_to_json(r);
    std::vector<std::string> keys;
    for (auto it = doc.begin(); it != doc.end(); ++it) keys.push_back(it.key());
    check(result, keys == std::vector<std::string>({"departure", "step_1", "step_2", "step_3",
                                                    "destination", "season", "info_sup", "metrics"}),
          "response key order");
    check(result, doc["step_1"] == "Alada (Allada) - 35.0km" && doc["destination"] == "Parakou - 180.0km",
          "leg formatting");
    check(result, doc["metrics"]["bus_fare"] == 6120 && doc["metrics"]["weight"] == "duration",
          "metrics object");
    check(result, r.settled_nodes > 0 && doc["metrics"]["settled_nodes"] == r.settled_nodes,
          "search effort in metrics");

    // Avoiding Bohicon takes the bypass
    RouteResult avoid = planner.compute_route(request("Cotonou", "Parakou", "bohicon"));
    check(result, avoid.avoid_city && *avoid.avoid_city == "Bɔxikɔn (Bohicon)", "avoided city rendered");
    check(result, avoid.excluded_nodes == 1 && near(avoid.metrics.distance_m, 335000.0), "bypass taken");
    check(result, avoid.steps.size() == 3 && avoid.steps[1].name == "Zagnanado" &&
                      near(avoid.steps[1].distance_km, 50.0),
          "bypass steps");
    check(result, avoid.summary_source == "Total: 335km, ~4h53 | Bus: ~6030F / Taxi: ~10050F", "bypass summary");
    auto avoid_doc = route_result_to_json(avoid);
    check(result, avoid_doc.contains("avoid_city") && avoid_doc["avoid_city"] == "Bɔxikɔn (Bohicon)",
          "avoid_city in response");

    // An avoided place that cannot be located excludes nothing
    RouteResult unknown_avoid = planner.compute_route(request("Cotonou", "Parakou", "Atlantis"));
    check(result, unknown_avoid.excluded_nodes == 0 && near(unknown_avoid.metrics.distance_m, 340000.0),
          "unknown avoided place");

    // Shortest distance prefers the bypass even without exclusion
    RouteRequest by_distance = request("Cotonou", "Parakou");
    by_distance.weight = WeightField::Length;
    RouteResult shortest = planner.compute_route(by_distance);
    check(result, near(shortest.metrics.distance_m, 335000.0) && near(shortest.cost, 335000.0),
          "distance weight");

    // Request errors
    check(result, fails_with(planner, request("Cotonou", "cotonou"), RouteError::Kind::Input,
                             "Origine et destination identiques (Cotonou)"),
          "same start and end rejected");
    check(result, fails_with(planner, request("Cotonou", "Atlantis"), RouteError::Kind::Input, "Lieu introuvable"),
          "unknown destination");
    check(result, fails_with(planner, request("Cotonou", "Lome"), RouteError::Kind::Input,
                             "Destination hors zone (Lome, TG)"),
          "destination outside the region");
    check(result, fails_with(planner, request("Lome", "Cotonou"), RouteError::Kind::Input,
                             "Départ incorrect (Lome, TG)"),
          "departure outside the region");

    geocoder.queries.clear();
    check(result, fails_with(planner, request("Cotonou", "Natitingou"), RouteError::Kind::NoPath,
                             "Aucun chemin trouvé"),
          "disconnected destination");
    check(result, std::find(geocoder.queries.begin(), geocoder.queries.end(), "Natitingou, Benin") !=
                      geocoder.queries.end(),
          "country suffix retried");

    bool cancelled = false;
    try {
        planner.compute_route(request("Cotonou", "Parakou"), []() { return true; });
    } catch (const RouteError& e) {
        cancelled = e.kind() == RouteError::Kind::Internal && e.details().rfind("cancelled: ", 0) == 0;
    }
    check(result, cancelled, "cancelled search is an internal error");

    auto error_doc = route_error_to_json(RouteError(RouteError::Kind::Input, "Lieu introuvable", "x"));
    check(result, error_doc["error"] == "Lieu introuvable" && error_doc["details"] == "x", "error body");

    // Rain in the north adds a delay
    PlannerConfig wet;
    wet.rain_latitude_threshold = 9.0;
    RoutePlanner rainy(graph, geocoder, gazetteer, no_translation, wet, localizer, "Benin");
    RouteRequest rain_req = request("Cotonou", "Parakou");
    rain_req.season = Season::Rain;
    RouteResult rain = rainy.compute_route(rain_req);
    check(result, rain.weather_degraded && rain.weather_delay_s == 1800.0, "rain delay applied");
    check(result, rain.summary_source ==
                      "Total: 340km, ~5h15 | [Météo] Route dégradée (+30min) | Bus: ~6120F / Taxi: ~10200F",
          "rain summary");
    check(result, rain.season == "Saison des Pluies", "rain label");

    RouteResult dry_north = rainy.compute_route(request("Cotonou", "Parakou"));
    check(result, !dry_north.weather_degraded, "no delay in the dry season");

    RouteResult rain_south = planner.compute_route(rain_req);
    check(result, !rain_south.weather_degraded, "no delay below the latitude threshold");

    // Long trips get the split suggestion
    PlannerConfig short_days;
    short_days.split_trip_hours = 4;
    RoutePlanner tired(graph, geocoder, gazetteer, no_translation, short_days, localizer, "Benin");
    RouteResult split = tired.compute_route(request("Cotonou", "Parakou"));
    check(result, split.summary_source ==
                      "Total: 340km, ~4h45 | Bus: ~6120F / Taxi: ~10200F | Suggestion: découper en 2 jours",
          "split suggestion");

    // Translation replaces the narrative strings
    FakeTranslator fon("[fon] ");
    RoutePlanner translated(graph, geocoder, gazetteer, fon, PlannerConfig{}, localizer, "Benin");
    RouteResult tr = translated.compute_route(request("Cotonou", "Parakou"));
    check(result, tr.season == "[fon] Saison Sèche" && tr.summary == "[fon] " + tr.summary_source,
          "translated season and summary");
    check(result, route_result_to_json(tr)["metrics"]["info_sup"] == tr.summary_source,
          "metrics keep the untranslated summary");

    // Path reverse geocoding failure keeps the whole distance on the destination
    EndpointsOnlyReverseGeocoder partial(gazetteer);
    RoutePlanner degraded(graph, geocoder, partial, no_translation, PlannerConfig{}, localizer, "Benin");
    RouteResult flat = degraded.compute_route(request("Cotonou", "Parakou"));
    check(result, flat.steps.empty() && near(flat.destination.distance_km, 340.0), "degraded segmentation");
}

// ============================================================
// REQUEST BODY
// ============================================================

static bool rejects_body(const std::string& body, const std::string& expected_problem) {
    RouteRequest req;
    std::string problem;
    return !parse_route_request(body, req, problem) && problem == expected_problem;
}

static void test_request_body(TestResult& result) {
    RouteRequest req;
    std::string problem;
    check(result, parse_route_request(R"({"start": "Cotonou", "end": "Parakou"})", req, problem) &&
                      req.start == "Cotonou" && req.end == "Parakou" && req.avoid.empty() &&
                      req.season == Season::Dry && req.weight == WeightField::TravelTime,
          "minimal body uses defaults");

    RouteRequest full;
    check(result, parse_route_request(R"({"start": "Cotonou", "end": "Parakou", "avoid": "Bohicon",
                                          "season": "RAIN", "weight": "distance"})",
                                      full, problem) &&
                      full.avoid == "Bohicon" && full.season == Season::Rain &&
                      full.weight == WeightField::Length,
          "all fields read");

    RouteRequest nulls;
    check(result, parse_route_request(R"({"start": "a", "end": "b", "avoid": null,
                                          "season": null, "weight": null})",
                                      nulls, problem) &&
                      nulls.avoid.empty() && nulls.season == Season::Dry,
          "null optional fields use defaults");

    check(result, rejects_body(R"({"start": "a", "end": "b", "season": 5})", "'season' must be a string"),
          "numeric season rejected");
    check(result, rejects_body(R"({"start": "a", "end": "b", "weight": true})", "'weight' must be a string"),
          "boolean weight rejected");
    check(result, rejects_body(R"({"start": "a", "end": "b", "avoid": ["x"]})", "'avoid' must be a string"),
          "array avoid rejected");
    check(result, rejects_body(R"({"start": "a", "end": "b", "season": "monsoon"})",
                               "unknown season 'monsoon' (dry or rain)"),
          "unknown season rejected");
    check(result, rejects_body(R"({"start": "a", "end": "b", "weight": "fuel"})",
                               "unknown weight 'fuel' (duration or distance)"),
          "unknown weight rejected");
    check(result, rejects_body(R"({"start": "a"})", "'start' and 'end' are required strings"),
          "missing end rejected");
    check(result, rejects_body(R"({"start": "a", "end": 3})", "'start' and 'end' are required strings"),
          "numeric end rejected");
    check(result, rejects_body("[1, 2]", "body must be a JSON object"), "array body rejected");
    check(result, rejects_body("{ broken", "body must be a JSON object"), "malformed body rejected");
}

// ============================================================
// NEAREST NODE
// ============================================================

// Same random nodes in two graphs; returns how many queries disagree
static int h3_disagreements(unsigned seed, int node_count, double span_deg, int queries) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> offset(0.0, span_deg);
    const double lat0 = 6.40, lon0 = 2.35;

    RoadGraph scanned, indexed;
    for (NodeId id = 1; id <= static_cast<NodeId>(node_count); ++id) {
        double lat = lat0 + offset(rng);
        double lon = lon0 + offset(rng);
        scanned.add_node(id, lat, lon);
        indexed.add_node(id, lat, lon);
    }
    indexed.build_spatial_index(SpatialIndexType::H3);

    int wrong = 0;
    for (int i = 0; i < queries; ++i) {
        double lat = lat0 + offset(rng);
        double lon = lon0 + offset(rng);
        auto expected = scanned.nearest_node(lat, lon);
        auto actual = indexed.nearest_node(lat, lon);
        if (expected != actual) {
            wrong++;
            if (g_verbose) {
                std::cerr << "  query (" << lat << ", " << lon << "): scan " << *expected
                          << ", h3 " << (actual ? std::to_string(*actual) : "none") << "\n";
            }
        }
    }
    return wrong;
}

static void test_nearest_node(TestResult& result) {
    RoadGraph graph = benin_graph();

    check(result, graph.nearest_node(9.3, 2.6) == NodeId(5), "nearest node without index");

    check(result, !graph.has_spatial_index(), "no index before build");
    graph.build_spatial_index(SpatialIndexType::H3);
    check(result, graph.has_spatial_index(), "index reported after build");
    check(result, graph.nearest_node(6.3701, 2.4201) == NodeId(1), "h3 index nearby node");
    check(result, graph.nearest_node(8.0, 2.0) == NodeId(4), "h3 index falls back to a scan");

    graph.build_spatial_index(SpatialIndexType::RTREE);
    check(result, graph.nearest_node(7.19, 2.09) == NodeId(3), "r-tree nearest node");

    RoadGraph empty;
    check(result, !empty.nearest_node(6.0, 2.0), "empty graph has no nearest node");

    // Sparse layouts leave empty rings between the query cell and the closest
    // node, so the first hit is often not the nearest one.
    check(result, h3_disagreements(7, 30, 0.03, 3000) == 0, "h3 lookup matches a full scan (sparse)");
    check(result, h3_disagreements(11, 120, 0.03, 3000) == 0, "h3 lookup matches a full scan (medium)");
    check(result, h3_disagreements(13, 600, 0.03, 2000) == 0, "h3 lookup matches a full scan (dense)");
    check(result, h3_disagreements(17, 8, 0.12, 1000) == 0, "h3 lookup matches a full scan (far apart)");
}

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--verbose") {
            g_verbose = true;
        } else if (arg == "--help") {
            std::cerr << "Usage: " << argv[0] << " [--verbose]\n";
            return 0;
        }
    }

    TestResult result;
    std::cout << "Running pipeline tests\n";
    std::cout << std::string(50, '-') << "\n";

    test_exclusion(result);
    test_segmentation(result);
    test_loading(result);
    test_names_and_config(result);
    test_request_body(result);
    test_nearest_node(result);
    test_planner(result);

    // Print results
    std::cout << std::string(50, '=') << "\n";
    std::cout << "RESULTS:\n";
    std::cout << "  Total:          " << result.total << "\n";
    std::cout << "  Passed:         " << result.passed
              << " (" << std::fixed << std::setprecision(1)
              << (100.0 * result.passed / result.total) << "%)\n";
    std::cout << "  Mismatches:     " << result.mismatches << "\n";

    int status = (result.mismatches == 0) ? 0 : 1;
    if (status == 0) {
        std::cout << "\n✓ ALL TESTS PASSED\n";
    } else {
        std::cout << "\n✗ " << result.mismatches << " TESTS FAILED\n";
    }

    return status;
}
