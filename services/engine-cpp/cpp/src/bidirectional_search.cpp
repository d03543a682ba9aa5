/**
 * @file bidirectional_search.cpp
 * @brief Bidirectional Dijkstra implementation.
 */

#include "bidirectional_search.hpp"

#include <algorithm>
#include <queue>
#include <unordered_map>

namespace {

// Priority queue entry
struct PQEntry {
    double dist;
    NodeId node;
    bool operator>(const PQEntry& o) const { return dist > o.dist; }
};

using MinHeap = std::priority_queue<PQEntry, std::vector<PQEntry>, std::greater<PQEntry>>;

// State of one search direction
struct Frontier {
    MinHeap pq;
    std::unordered_map<NodeId, double> dist;
    std::unordered_map<NodeId, NodeId> parent;  // predecessor (fwd) / successor (bwd)
    std::unordered_set<NodeId> settled;
};

// Pop one entry and relax its edges. `adjacent` lists bundle indices and
// `far_end` picks the neighbour out of a bundle for this direction.
template <typename Adjacent, typename FarEnd>
void expand_once(const RoadGraph& graph, WeightField weight, const ExclusionSet& excluded,
                 Frontier& self, const Frontier& other,
                 Adjacent adjacent, FarEnd far_end,
                 double& best, NodeId& meeting, bool& found) {
    auto [d, u] = self.pq.top();
    self.pq.pop();

    // Stale entries and excluded nodes are dropped here
    if (excluded.count(u)) return;
    if (!self.settled.insert(u).second) return;

    for (uint32_t idx : adjacent(u)) {
        const EdgeBundle& bundle = graph.bundle(idx);
        NodeId v = far_end(bundle);
        if (excluded.count(v)) continue;

        double w = min_weight(bundle, weight);
        if (!(w < kInfinity)) continue;  // no variant carries the field

        double nd = d + w;
        auto v_it = self.dist.find(v);
        if (v_it != self.dist.end() && nd >= v_it->second) continue;

        self.dist[v] = nd;
        self.parent[v] = u;
        self.pq.push({nd, v});

        auto other_it = other.dist.find(v);
        if (other_it != other.dist.end()) {
            double total = nd + other_it->second;
            if (total < best) {
                best = total;
                meeting = v;
                found = true;
            }
        }
    }
}

}  // namespace

const char* search_status_name(SearchStatus status) {
    switch (status) {
        case SearchStatus::Found: return "found";
        case SearchStatus::NoPath: return "no_path";
        case SearchStatus::NodeNotFound: return "node_not_found";
        case SearchStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

SearchResult bidirectional_dijkstra(const RoadGraph& graph,
                                    NodeId start,
                                    NodeId end,
                                    WeightField weight,
                                    const ExclusionSet& excluded,
                                    const CancelCheck& cancelled) {
    SearchResult result;

    if (!graph.has_node(start)) {
        result.status = SearchStatus::NodeNotFound;
        result.error = "Start node " + std::to_string(start) + " not found in graph";
        return result;
    }
    if (!graph.has_node(end)) {
        result.status = SearchStatus::NodeNotFound;
        result.error = "End node " + std::to_string(end) + " not found in graph";
        return result;
    }

    if (start == end) {
        result.path = {start};
        result.cost = 0.0;
        result.status = SearchStatus::Found;
        return result;
    }

    Frontier fwd, bwd;
    fwd.dist[start] = 0.0;
    fwd.pq.push({0.0, start});
    bwd.dist[end] = 0.0;
    bwd.pq.push({0.0, end});

    auto out_edges = [&graph](NodeId n) -> const std::vector<uint32_t>& { return graph.outgoing(n); };
    auto in_edges = [&graph](NodeId n) -> const std::vector<uint32_t>& { return graph.incoming(n); };
    auto head = [](const EdgeBundle& b) { return b.to; };
    auto tail = [](const EdgeBundle& b) { return b.from; };

    double best = kInfinity;
    NodeId meeting = start;
    bool found = false;

    while (!fwd.pq.empty() && !bwd.pq.empty()) {
        // No pair of frontier nodes can beat the best connection any more
        if (fwd.pq.top().dist + bwd.pq.top().dist >= best) break;

        if (cancelled && cancelled()) {
            result.status = SearchStatus::Cancelled;
            result.error = "Search cancelled";
            result.settled = fwd.settled.size() + bwd.settled.size();
            return result;
        }

        expand_once(graph, weight, excluded, fwd, bwd, out_edges, head, best, meeting, found);
        if (!bwd.pq.empty()) {
            expand_once(graph, weight, excluded, bwd, fwd, in_edges, tail, best, meeting, found);
        }
    }

    result.settled = fwd.settled.size() + bwd.settled.size();

    if (!found) {
        result.error = "No path found between " + std::to_string(start) +
                       " and " + std::to_string(end);
        return result;
    }

    // Forward path: meeting -> start, then reversed
    std::vector<NodeId> path;
    NodeId curr = meeting;
    while (true) {
        path.push_back(curr);
        auto it = fwd.parent.find(curr);
        if (it == fwd.parent.end()) break;
        curr = it->second;
    }
    std::reverse(path.begin(), path.end());

    // Backward path: successor of meeting -> end
    auto it = bwd.parent.find(meeting);
    while (it != bwd.parent.end()) {
        path.push_back(it->second);
        it = bwd.parent.find(it->second);
    }

    result.path = std::move(path);
    result.cost = best;
    result.status = SearchStatus::Found;
    return result;
}
