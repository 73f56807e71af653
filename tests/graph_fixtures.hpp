#pragma once

#include <graph_model/types.hpp>
#include <memory>
#include <string>
#include <vector>

namespace graph_test {

inline graph_model::GraphNode node(const std::string& id, const std::string& label = "Node",
    const std::string& modality = "", const std::string& title = "")
{
    graph_model::GraphNode n;
    n.id = id;
    n.label = label;
    n.modality = modality;
    n.title = title.empty() ? id : title;
    return n;
}

inline graph_model::GraphEdge edge(const std::string& source, const std::string& target,
    const std::string& type = "RELATED", const std::string& id = "")
{
    graph_model::GraphEdge e;
    e.source = source;
    e.target = target;
    e.type = type;
    e.id = id.empty() ? source + "->" + target : id;
    return e;
}

inline std::shared_ptr<const graph_model::Snapshot> snapshot(std::vector<graph_model::GraphNode> nodes,
    std::vector<graph_model::GraphEdge> edges = {},
    const std::string& generated_at = "2024-06-01T12:00:00.000Z")
{
    graph_model::Snapshot s;
    s.generated_at = generated_at;
    s.nodes = std::move(nodes);
    s.edges = std::move(edges);
    s.meta = graph_model::compute_snapshot_meta(s);
    return std::make_shared<const graph_model::Snapshot>(std::move(s));
}

} // namespace graph_test
