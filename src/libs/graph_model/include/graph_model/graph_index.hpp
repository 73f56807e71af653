#pragma once

#include <graph_model/types.hpp>
#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace graph_model {

// Id-indexed view over one snapshot. Rebuilt whenever a new snapshot arrives;
// holds the snapshot alive so node/edge pointers stay valid.
class GraphIndex {
public:
    GraphIndex() = default;
    explicit GraphIndex(std::shared_ptr<const Snapshot> snapshot);

    const Snapshot* snapshot() const { return snapshot_.get(); }
    std::shared_ptr<const Snapshot> shared_snapshot() const { return snapshot_; }
    bool empty() const { return nodes_.empty(); }

    const std::vector<const GraphNode*>& nodes() const { return nodes_; }
    // Edges whose endpoints both exist, in snapshot order.
    const std::vector<const GraphEdge*>& edges() const { return edges_; }
    std::size_t dropped_edge_count() const { return dropped_edges_; }

    const GraphNode* find_node(const std::string& id) const;
    const GraphEdge* find_edge(const std::string& id) const;

    // Undirected adjacency; empty set for unknown ids.
    const std::unordered_set<std::string>& neighbors(const std::string& id) const;
    std::size_t degree(const std::string& id) const { return neighbors(id).size(); }
    const std::vector<const GraphEdge*>& incident_edges(const std::string& id) const;

    bool contains_node(const std::string& id) const { return node_by_id_.count(id) != 0; }

private:
    std::shared_ptr<const Snapshot> snapshot_;
    std::vector<const GraphNode*> nodes_;
    std::vector<const GraphEdge*> edges_;
    std::unordered_map<std::string, const GraphNode*> node_by_id_;
    std::unordered_map<std::string, const GraphEdge*> edge_by_id_;
    std::unordered_map<std::string, std::unordered_set<std::string>> adjacency_;
    std::unordered_map<std::string, std::vector<const GraphEdge*>> incident_;
    std::size_t dropped_edges_ = 0;
};

} // namespace graph_model
