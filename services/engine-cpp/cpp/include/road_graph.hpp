/**
 * @file road_graph.hpp
 * @brief Directed road multigraph with node coordinates and spatial lookup.
 */

#pragma once

#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>
#include <boost/geometry.hpp>
#include <boost/geometry/geometries/point.hpp>
#include <boost/geometry/index/rtree.hpp>

namespace bg = boost::geometry;
namespace bgi = boost::geometry::index;

using NodeId = int64_t;

// Geometry types for R-tree (x = lon, y = lat)
using Point2D = bg::model::point<double, 2, bg::cs::cartesian>;
using RTreeValue = std::pair<Point2D, uint32_t>;  // point + node index

constexpr double kInfinity = std::numeric_limits<double>::infinity();

/**
 * @brief Geographic coordinate in degrees.
 */
struct Coordinate {
    double lat = 0.0;
    double lon = 0.0;
};

/**
 * @brief Road intersection.
 */
struct RoadNode {
    NodeId id = 0;
    Coordinate coord;
};

/**
 * @brief One physical road segment between two intersections.
 */
struct EdgeVariant {
    double length = 0.0;                ///< Meters
    double travel_time = kInfinity;     ///< Seconds, +inf when unknown
    std::vector<std::string> names;     ///< Street names (may be empty)
};

/**
 * @brief All parallel road segments of one ordered node pair.
 */
struct EdgeBundle {
    NodeId from = 0;
    NodeId to = 0;
    std::vector<EdgeVariant> variants;
};

/**
 * @brief Edge attribute minimised by the search.
 */
enum class WeightField {
    Length,      ///< "distance": shortest route
    TravelTime   ///< "duration": fastest route
};

/**
 * @brief Parse "distance"/"length" or "duration"/"travel_time".
 * @return false if the text names no known field
 */
bool parse_weight_field(const std::string& text, WeightField& out);

const char* weight_field_name(WeightField field);

/**
 * @brief Value of one field on one variant (+inf if unknown).
 */
double variant_weight(const EdgeVariant& variant, WeightField field);

/**
 * @brief Minimum of a field across all variants of a bundle.
 */
double min_weight(const EdgeBundle& bundle, WeightField field);

/**
 * @brief Raised when the graph lacks data a valid path relies on.
 */
class GraphError : public std::runtime_error {
public:
    explicit GraphError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Spatial index type.
 */
enum class SpatialIndexType {
    H3,      ///< H3 cell-based index
    RTREE    ///< Boost R-tree index
};

/**
 * @brief Read-only road network once loaded.
 *
 * Loading and index building mutate the graph and must finish before
 * queries start. All const methods are safe to call concurrently.
 */
class RoadGraph {
public:
    /**
     * @brief Load nodes from CSV (id/osmid, y/lat, x/lon/lng) or Parquet.
     * @return true if at least one node was loaded
     */
    bool load_nodes(const std::string& path);

    /**
     * @brief Load edges from CSV (u, v, length, travel_time, name) or Parquet.
     *
     * A directory is read as a set of Parquet files. Edges whose endpoints
     * are unknown are skipped.
     * @return true if at least one edge was loaded
     */
    bool load_edges(const std::string& path);

#ifdef HAVE_DUCKDB
    /**
     * @brief Load nodes and edges from a DuckDB database.
     * Expects tables nodes(id, lat, lon) and edges(u, v, length, travel_time, name).
     */
    bool load_from_duckdb(const std::string& db_path);
#endif

    void add_node(NodeId id, double lat, double lon);

    /**
     * @brief Add a variant to the bundle from -> to, creating it if needed.
     * @return false if either endpoint is unknown or length is negative
     */
    bool add_edge(NodeId from, NodeId to, const EdgeVariant& variant);

    /**
     * @brief Build spatial index for nearest node search.
     */
    void build_spatial_index(SpatialIndexType type = SpatialIndexType::H3);

    /**
     * @brief Closest node to a coordinate, std::nullopt on an empty graph.
     */
    std::optional<NodeId> nearest_node(double lat, double lng) const;

    bool has_node(NodeId id) const { return node_index_.count(id) > 0; }

    const RoadNode* get_node(NodeId id) const;

    /**
     * @brief Coordinate of a node.
     * @throws GraphError if the node does not exist
     */
    Coordinate coordinate_of(NodeId id) const;

    /// Bundle indices leaving a node.
    const std::vector<uint32_t>& outgoing(NodeId id) const;

    /// Bundle indices entering a node.
    const std::vector<uint32_t>& incoming(NodeId id) const;

    const EdgeBundle& bundle(uint32_t index) const { return bundles_[index]; }

    /// Bundle from -> to, or nullptr.
    const EdgeBundle* find_bundle(NodeId from, NodeId to) const;

    const std::vector<RoadNode>& nodes() const { return nodes_; }

    size_t node_count() const { return nodes_.size(); }
    size_t bundle_count() const { return bundles_.size(); }
    size_t edge_count() const { return edge_count_; }
    bool has_spatial_index() const { return spatial_index_built_; }

private:
    std::optional<NodeId> nearest_node_scan(double lat, double lng) const;

    std::vector<RoadNode> nodes_;
    std::unordered_map<NodeId, uint32_t> node_index_;

    std::vector<EdgeBundle> bundles_;
    std::unordered_map<NodeId, std::vector<uint32_t>> fwd_adj_;
    std::unordered_map<NodeId, std::vector<uint32_t>> bwd_adj_;
    size_t edge_count_ = 0;

    // Spatial indexing
    bool spatial_index_built_ = false;
    SpatialIndexType spatial_index_type_ = SpatialIndexType::H3;

    // H3 index: h3_cell -> [node indices]
    std::unordered_map<uint64_t, std::vector<uint32_t>> h3_index_;
    int h3_index_res_ = 9;  ///< H3 resolution for indexing

    // R-tree index
    std::unique_ptr<bgi::rtree<RTreeValue, bgi::quadratic<16>>> rtree_;
};
