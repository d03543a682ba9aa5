/**
 * @file road_graph.cpp
 * @brief RoadGraph implementation - loading, adjacency and spatial lookup.
 */

#include "road_graph.hpp"
#include "csv_utils.hpp"
#include "h3_utils.hpp"

#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/reader.h>

#ifdef HAVE_DUCKDB
#include <duckdb.hpp>
#endif

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <initializer_list>

namespace fs = std::filesystem;

// ============================================================
// WEIGHT SELECTION
// ============================================================

bool parse_weight_field(const std::string& text, WeightField& out) {
    if (text == "duration" || text == "travel_time" || text == "time") {
        out = WeightField::TravelTime;
        return true;
    }
    if (text == "distance" || text == "length") {
        out = WeightField::Length;
        return true;
    }
    return false;
}

const char* weight_field_name(WeightField field) {
    return field == WeightField::Length ? "distance" : "duration";
}

double variant_weight(const EdgeVariant& variant, WeightField field) {
    return field == WeightField::Length ? variant.length : variant.travel_time;
}

double min_weight(const EdgeBundle& bundle, WeightField field) {
    double best = kInfinity;
    for (const auto& v : bundle.variants) {
        best = std::min(best, variant_weight(v, field));
    }
    return best;
}

// ============================================================
// CSV HELPERS
// ============================================================

using csv_utils::find_column;
using csv_utils::trim;

// Parse an OSM name cell: "Rue 1" or "['RNIE1', 'Route de Kandi']"
static std::vector<std::string> parse_names(const std::string& raw) {
    std::vector<std::string> names;
    std::string s = trim(raw);
    if (s.empty() || s == "nan" || s == "None") return names;

    if (s.front() == '[' && s.back() == ']') {
        s = s.substr(1, s.size() - 2);
        std::stringstream ss(s);
        std::string part;
        while (std::getline(ss, part, ',')) {
            std::string name = trim(part);
            if (!name.empty()) names.push_back(name);
        }
    } else {
        names.push_back(s);
    }
    return names;
}

static double parse_optional_double(const std::string& raw, double fallback) {
    std::string s = trim(raw);
    if (s.empty() || s == "nan" || s == "None") return fallback;
    return std::stod(s);
}

// ============================================================
// GRAPH CONSTRUCTION
// ============================================================

void RoadGraph::add_node(NodeId id, double lat, double lon) {
    auto it = node_index_.find(id);
    if (it != node_index_.end()) {
        nodes_[it->second].coord = {lat, lon};
        return;
    }
    node_index_[id] = static_cast<uint32_t>(nodes_.size());
    nodes_.push_back({id, {lat, lon}});
}

bool RoadGraph::add_edge(NodeId from, NodeId to, const EdgeVariant& variant) {
    if (!has_node(from) || !has_node(to)) return false;
    if (!(variant.length >= 0.0)) return false;
    if (variant.travel_time < 0.0) return false;

    auto& out = fwd_adj_[from];
    for (uint32_t idx : out) {
        if (bundles_[idx].to == to) {
            bundles_[idx].variants.push_back(variant);
            ++edge_count_;
            return true;
        }
    }

    uint32_t idx = static_cast<uint32_t>(bundles_.size());
    bundles_.push_back({from, to, {variant}});
    out.push_back(idx);
    bwd_adj_[to].push_back(idx);
    ++edge_count_;
    return true;
}

// ============================================================
// LOADING
// ============================================================

static bool load_nodes_csv(const std::string& path, RoadGraph& graph) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "Cannot open nodes file: " << path << "\n";
        return false;
    }

    std::string header_line;
    std::getline(file, header_line);
    auto cols = csv_utils::parse_header(header_line);

    int idx_id = find_column(cols, {"osmid", "id", "node_id"});
    int idx_lat = find_column(cols, {"y", "lat", "latitude"});
    int idx_lon = find_column(cols, {"x", "lon", "lng", "longitude"});
    if (idx_id < 0 || idx_lat < 0 || idx_lon < 0) {
        std::cerr << "Nodes CSV needs id, lat (y) and lon (x) columns: " << path << "\n";
        return false;
    }
    int min_cols = std::max({idx_id, idx_lat, idx_lon}) + 1;

    size_t before = graph.node_count();
    size_t skipped = 0;
    std::string line;
    while (std::getline(file, line)) {
        if (line.empty()) continue;
        auto row = csv_utils::split_line(line);
        if (static_cast<int>(row.size()) < min_cols) {
            ++skipped;
            continue;
        }
        try {
            NodeId id = std::stoll(trim(row[idx_id]));
            double lat = std::stod(trim(row[idx_lat]));
            double lon = std::stod(trim(row[idx_lon]));
            graph.add_node(id, lat, lon);
        } catch (const std::exception&) {
            ++skipped;  // Skip malformed rows
        }
    }

    if (skipped > 0) {
        std::cerr << "Warning: skipped " << skipped << " malformed node rows\n";
    }
    return graph.node_count() > before;
}

static bool load_edges_csv(const std::string& path, RoadGraph& graph) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "Cannot open edges file: " << path << "\n";
        return false;
    }

    std::string header_line;
    std::getline(file, header_line);
    auto cols = csv_utils::parse_header(header_line);

    int idx_u = find_column(cols, {"u", "from", "source"});
    int idx_v = find_column(cols, {"v", "to", "target"});
    int idx_length = find_column(cols, {"length"});
    int idx_time = find_column(cols, {"travel_time", "duration"});
    int idx_name = find_column(cols, {"name"});
    if (idx_u < 0 || idx_v < 0 || idx_length < 0) {
        std::cerr << "Edges CSV needs u, v and length columns: " << path << "\n";
        return false;
    }
    int min_cols = std::max({idx_u, idx_v, idx_length}) + 1;

    size_t before = graph.edge_count();
    size_t skipped = 0;
    std::string line;
    while (std::getline(file, line)) {
        if (line.empty()) continue;
        auto row = csv_utils::split_line(line);
        if (static_cast<int>(row.size()) < min_cols) {
            ++skipped;
            continue;
        }
        try {
            NodeId u = std::stoll(trim(row[idx_u]));
            NodeId v = std::stoll(trim(row[idx_v]));
            EdgeVariant variant;
            variant.length = std::stod(trim(row[idx_length]));
            if (idx_time >= 0 && idx_time < (int)row.size()) {
                variant.travel_time = parse_optional_double(row[idx_time], kInfinity);
            }
            if (idx_name >= 0 && idx_name < (int)row.size()) {
                variant.names = parse_names(row[idx_name]);
            }
            if (!graph.add_edge(u, v, variant)) ++skipped;
        } catch (const std::exception&) {
            ++skipped;  // Skip malformed rows
        }
    }

    if (skipped > 0) {
        std::cerr << "Warning: skipped " << skipped << " edge rows (malformed or unknown nodes)\n";
    }
    return graph.edge_count() > before;
}

static std::shared_ptr<arrow::Table> read_parquet_table(const std::string& filepath) {
    arrow::MemoryPool* pool = arrow::default_memory_pool();

    std::shared_ptr<arrow::io::ReadableFile> infile;
    PARQUET_ASSIGN_OR_THROW(infile, arrow::io::ReadableFile::Open(filepath, pool));

    std::unique_ptr<parquet::arrow::FileReader> reader;
    PARQUET_THROW_NOT_OK(parquet::arrow::OpenFile(infile, pool, &reader));

    std::shared_ptr<arrow::Table> table;
    PARQUET_THROW_NOT_OK(reader->ReadTable(&table));
    return table;
}

static std::shared_ptr<arrow::ChunkedArray> column_by_names(
    const std::shared_ptr<arrow::Table>& table, std::initializer_list<const char*> names) {
    for (const char* name : names) {
        auto col = table->GetColumnByName(name);
        if (col) return col;
    }
    return nullptr;
}

static void load_nodes_parquet_file(const std::string& filepath, RoadGraph& graph) {
    auto table = read_parquet_table(filepath);

    auto id_chunked = column_by_names(table, {"osmid", "id", "node_id"});
    auto lat_chunked = column_by_names(table, {"y", "lat"});
    auto lon_chunked = column_by_names(table, {"x", "lon", "lng"});
    if (!id_chunked || !lat_chunked || !lon_chunked) {
        throw std::runtime_error("missing id/lat/lon columns in " + filepath);
    }

    for (int chunk = 0; chunk < id_chunked->num_chunks(); ++chunk) {
        auto id_col = std::static_pointer_cast<arrow::Int64Array>(id_chunked->chunk(chunk));
        auto lat_col = std::static_pointer_cast<arrow::DoubleArray>(lat_chunked->chunk(chunk));
        auto lon_col = std::static_pointer_cast<arrow::DoubleArray>(lon_chunked->chunk(chunk));

        for (int64_t i = 0; i < id_col->length(); ++i) {
            graph.add_node(id_col->Value(i), lat_col->Value(i), lon_col->Value(i));
        }
    }
}

static void load_edges_parquet_file(const std::string& filepath, RoadGraph& graph) {
    auto table = read_parquet_table(filepath);

    // Handle chunked columns
    auto u_chunked = column_by_names(table, {"u", "from"});
    auto v_chunked = column_by_names(table, {"v", "to"});
    auto length_chunked = column_by_names(table, {"length"});
    auto time_chunked = column_by_names(table, {"travel_time", "duration"});
    auto name_chunked = column_by_names(table, {"name"});
    if (!u_chunked || !v_chunked || !length_chunked) {
        throw std::runtime_error("missing u/v/length columns in " + filepath);
    }

    size_t skipped = 0;
    for (int chunk = 0; chunk < u_chunked->num_chunks(); ++chunk) {
        auto u_col = std::static_pointer_cast<arrow::Int64Array>(u_chunked->chunk(chunk));
        auto v_col = std::static_pointer_cast<arrow::Int64Array>(v_chunked->chunk(chunk));
        auto length_col = std::static_pointer_cast<arrow::DoubleArray>(length_chunked->chunk(chunk));
        std::shared_ptr<arrow::DoubleArray> time_col;
        std::shared_ptr<arrow::StringArray> name_col;
        if (time_chunked) {
            time_col = std::static_pointer_cast<arrow::DoubleArray>(time_chunked->chunk(chunk));
        }
        if (name_chunked) {
            name_col = std::static_pointer_cast<arrow::StringArray>(name_chunked->chunk(chunk));
        }

        for (int64_t i = 0; i < u_col->length(); ++i) {
            EdgeVariant variant;
            variant.length = length_col->Value(i);
            if (time_col && !time_col->IsNull(i)) {
                variant.travel_time = time_col->Value(i);
            }
            if (name_col && !name_col->IsNull(i)) {
                variant.names = parse_names(name_col->GetString(i));
            }
            if (!graph.add_edge(u_col->Value(i), v_col->Value(i), variant)) ++skipped;
        }
    }

    if (skipped > 0) {
        std::cerr << "Warning: skipped " << skipped << " edges in " << filepath << "\n";
    }
}

static bool is_parquet_path(const std::string& path) {
    std::error_code ec;  // unreadable paths fall through to the CSV loader's error
    return fs::is_directory(path, ec) || fs::path(path).extension() == ".parquet";
}

// Apply a per-file loader to a single file or every .parquet file of a directory
template <typename Loader>
static bool for_each_parquet(const std::string& path, Loader load) {
    try {
        if (fs::is_directory(path)) {
            std::vector<std::string> files;
            for (const auto& entry : fs::directory_iterator(path)) {
                if (entry.path().extension() == ".parquet") {
                    files.push_back(entry.path().string());
                }
            }
            std::sort(files.begin(), files.end());
            for (const auto& f : files) load(f);
        } else {
            load(path);
        }
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Parquet error: " << e.what() << "\n";
        return false;
    }
}

bool RoadGraph::load_nodes(const std::string& path) {
    size_t before = nodes_.size();
    if (is_parquet_path(path)) {
        if (!for_each_parquet(path, [this](const std::string& f) { load_nodes_parquet_file(f, *this); })) {
            return false;
        }
    } else if (!load_nodes_csv(path, *this)) {
        return false;
    }
    std::cout << "  Loaded " << (nodes_.size() - before) << " nodes\n";
    return nodes_.size() > before;
}

bool RoadGraph::load_edges(const std::string& path) {
    size_t before = edge_count_;
    if (is_parquet_path(path)) {
        if (!for_each_parquet(path, [this](const std::string& f) { load_edges_parquet_file(f, *this); })) {
            return false;
        }
    } else if (!load_edges_csv(path, *this)) {
        return false;
    }
    std::cout << "  Loaded " << (edge_count_ - before) << " edges in "
              << bundles_.size() << " node pairs\n";
    return edge_count_ > before;
}

// ============================================================
// ACCESSORS
// ============================================================

const RoadNode* RoadGraph::get_node(NodeId id) const {
    auto it = node_index_.find(id);
    return (it != node_index_.end()) ? &nodes_[it->second] : nullptr;
}

Coordinate RoadGraph::coordinate_of(NodeId id) const {
    const RoadNode* node = get_node(id);
    if (!node) {
        throw GraphError("Node " + std::to_string(id) + " not found in graph");
    }
    return node->coord;
}

const std::vector<uint32_t>& RoadGraph::outgoing(NodeId id) const {
    static const std::vector<uint32_t> kNone;
    auto it = fwd_adj_.find(id);
    return (it != fwd_adj_.end()) ? it->second : kNone;
}

const std::vector<uint32_t>& RoadGraph::incoming(NodeId id) const {
    static const std::vector<uint32_t> kNone;
    auto it = bwd_adj_.find(id);
    return (it != bwd_adj_.end()) ? it->second : kNone;
}

const EdgeBundle* RoadGraph::find_bundle(NodeId from, NodeId to) const {
    for (uint32_t idx : outgoing(from)) {
        if (bundles_[idx].to == to) return &bundles_[idx];
    }
    return nullptr;
}

// ============================================================
// SPATIAL INDEXING METHODS
// ============================================================

void RoadGraph::build_spatial_index(SpatialIndexType type) {
    spatial_index_type_ = type;

    if (type == SpatialIndexType::H3) {
        h3_index_.clear();
        for (uint32_t i = 0; i < nodes_.size(); ++i) {
            const auto& c = nodes_[i].coord;
            uint64_t cell = h3_utils::latlng_to_cell(c.lat, c.lon, h3_index_res_);
            if (cell != 0) {
                h3_index_[cell].push_back(i);
            }
        }
        std::cout << "Built H3 index with " << h3_index_.size() << " cells at res " << h3_index_res_ << "\n";
    } else {
        rtree_ = std::make_unique<bgi::rtree<RTreeValue, bgi::quadratic<16>>>();
        for (uint32_t i = 0; i < nodes_.size(); ++i) {
            const auto& c = nodes_[i].coord;
            rtree_->insert({Point2D(c.lon, c.lat), i});
        }
        std::cout << "Built R-tree index with " << rtree_->size() << " entries\n";
    }

    spatial_index_built_ = true;
}

// Helper: Haversine distance in meters
static double haversine_distance(double lat1, double lon1, double lat2, double lon2) {
    const double R = 6371000.0;  // Earth radius in meters
    double dLat = (lat2 - lat1) * M_PI / 180.0;
    double dLon = (lon2 - lon1) * M_PI / 180.0;
    double a = sin(dLat/2) * sin(dLat/2) +
               cos(lat1 * M_PI / 180.0) * cos(lat2 * M_PI / 180.0) *
               sin(dLon/2) * sin(dLon/2);
    double c = 2 * atan2(sqrt(a), sqrt(1-a));
    return R * c;
}

std::optional<NodeId> RoadGraph::nearest_node_scan(double lat, double lng) const {
    std::optional<NodeId> best;
    double best_dist = kInfinity;
    for (const auto& node : nodes_) {
        double d = haversine_distance(lat, lng, node.coord.lat, node.coord.lon);
        if (d < best_dist) {
            best_dist = d;
            best = node.id;
        }
    }
    return best;
}

std::optional<NodeId> RoadGraph::nearest_node(double lat, double lng) const {
    if (nodes_.empty()) return std::nullopt;

    // Without an index every node is a candidate
    if (!spatial_index_built_) return nearest_node_scan(lat, lng);

    if (spatial_index_type_ == SpatialIndexType::RTREE) {
        if (!rtree_) return nearest_node_scan(lat, lng);
        std::vector<RTreeValue> candidates;
        rtree_->query(bgi::nearest(Point2D(lng, lat), 1), std::back_inserter(candidates));
        if (candidates.empty()) return std::nullopt;
        return nodes_[candidates.front().second].id;
    }

    uint64_t center_cell = h3_utils::latlng_to_cell(lat, lng, h3_index_res_);
    if (center_cell == 0) return nearest_node_scan(lat, lng);

    // A node in ring k lies at least (1.5k - 2) edge lengths from any point
    // of the center cell. Rings are expanded until that bound passes the best
    // distance found so far; 0.8 absorbs the size spread between nearby cells.
    const int max_rings = 8;
    const double edge_m = 0.8 * h3_utils::cell_edge_length_m(center_cell);
    if (edge_m <= 0.0) return nearest_node_scan(lat, lng);
    auto ring_lower_bound = [edge_m](int k) {
        return std::max(0.0, (1.5 * k - 2.0) * edge_m);
    };

    std::optional<NodeId> best;
    double best_dist = kInfinity;

    for (int k = 0; k <= max_rings; ++k) {
        if (best && ring_lower_bound(k) >= best_dist) return best;
        for (uint64_t cell : h3_utils::grid_ring(center_cell, k)) {
            auto it = h3_index_.find(cell);
            if (it == h3_index_.end()) continue;
            for (uint32_t idx : it->second) {
                const auto& c = nodes_[idx].coord;
                double d = haversine_distance(lat, lng, c.lat, c.lon);
                if (d < best_dist) {
                    best_dist = d;
                    best = nodes_[idx].id;
                }
            }
        }
    }
    if (best && ring_lower_bound(max_rings + 1) >= best_dist) return best;

    // Nothing close enough to be certain within max_rings: exact pass
    return nearest_node_scan(lat, lng);
}

#ifdef HAVE_DUCKDB

bool RoadGraph::load_from_duckdb(const std::string& db_path) {
    std::cout << "Loading data from DuckDB: " << db_path << std::endl;

    try {
        // Open in read-only mode to avoid lock conflicts with the graph builder
        duckdb::DBConfig config;
        config.options.access_mode = duckdb::AccessMode::READ_ONLY;
        duckdb::DuckDB db(db_path, &config);
        duckdb::Connection con(db);

        auto result = con.Query("SELECT id, lat, lon FROM nodes");
        if (result->HasError()) {
            std::cerr << "Error loading nodes: " << result->GetError() << std::endl;
            return false;
        }
        while (auto chunk = result->Fetch()) {
            for (idx_t i = 0; i < chunk->size(); i++) {
                add_node(chunk->GetValue(0, i).GetValue<int64_t>(),
                         chunk->GetValue(1, i).GetValue<double>(),
                         chunk->GetValue(2, i).GetValue<double>());
            }
        }
        std::cout << "  Loaded " << nodes_.size() << " nodes" << std::endl;

        result = con.Query("SELECT u, v, length, travel_time, name FROM edges");
        if (result->HasError()) {
            std::cerr << "Error loading edges: " << result->GetError() << std::endl;
            return false;
        }
        size_t skipped = 0;
        while (auto chunk = result->Fetch()) {
            for (idx_t i = 0; i < chunk->size(); i++) {
                EdgeVariant variant;
                variant.length = chunk->GetValue(2, i).GetValue<double>();
                auto time_value = chunk->GetValue(3, i);
                if (!time_value.IsNull()) variant.travel_time = time_value.GetValue<double>();
                auto name_value = chunk->GetValue(4, i);
                if (!name_value.IsNull()) variant.names = parse_names(name_value.ToString());

                if (!add_edge(chunk->GetValue(0, i).GetValue<int64_t>(),
                              chunk->GetValue(1, i).GetValue<int64_t>(), variant)) {
                    ++skipped;
                }
            }
        }
        if (skipped > 0) {
            std::cerr << "Warning: skipped " << skipped << " edges with unknown endpoints" << std::endl;
        }
        std::cout << "  Loaded " << edge_count_ << " edges" << std::endl;

        std::cout << "DuckDB loading complete." << std::endl;
        return !nodes_.empty() && edge_count_ > 0;

    } catch (const std::exception& e) {
        std::cerr << "DuckDB error: " << e.what() << std::endl;
        return false;
    }
}

#endif // HAVE_DUCKDB
