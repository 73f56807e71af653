#include <graph_model/graph_index.hpp>
#include <utility>

namespace graph_model {

namespace {

const std::unordered_set<std::string> no_neighbors;
const std::vector<const GraphEdge*> no_edges;

} // namespace

GraphIndex::GraphIndex(std::shared_ptr<const Snapshot> snapshot)
    : snapshot_(std::move(snapshot))
{
    if (!snapshot_) return;

    nodes_.reserve(snapshot_->nodes.size());
    for (const auto& node : snapshot_->nodes) {
        if (!node_by_id_.emplace(node.id, &node).second) continue;
        nodes_.push_back(&node);
    }

    edges_.reserve(snapshot_->edges.size());
    for (const auto& edge : snapshot_->edges) {
        if (!contains_node(edge.source) || !contains_node(edge.target)) {
            ++dropped_edges_;
            continue;
        }
        if (!edge_by_id_.emplace(edge.id, &edge).second) {
            ++dropped_edges_;
            continue;
        }
        edges_.push_back(&edge);
        if (edge.source != edge.target) {
            adjacency_[edge.source].insert(edge.target);
            adjacency_[edge.target].insert(edge.source);
        }
        incident_[edge.source].push_back(&edge);
        if (edge.target != edge.source) incident_[edge.target].push_back(&edge);
    }
}

const GraphNode* GraphIndex::find_node(const std::string& id) const {
    auto it = node_by_id_.find(id);
    return it == node_by_id_.end() ? nullptr : it->second;
}

const GraphEdge* GraphIndex::find_edge(const std::string& id) const {
    auto it = edge_by_id_.find(id);
    return it == edge_by_id_.end() ? nullptr : it->second;
}

const std::unordered_set<std::string>& GraphIndex::neighbors(const std::string& id) const {
    auto it = adjacency_.find(id);
    return it == adjacency_.end() ? no_neighbors : it->second;
}

const std::vector<const GraphEdge*>& GraphIndex::incident_edges(const std::string& id) const {
    auto it = incident_.find(id);
    return it == incident_.end() ? no_edges : it->second;
}

} // namespace graph_model
