#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace graph_model {

using PropertyMap = std::map<std::string, std::string>;

struct GraphNode {
    std::string id;
    std::string label = "Node";
    std::string modality;
    std::string title;
    std::string created_at;
    std::string updated_at;
    PropertyMap props;
};

struct GraphEdge {
    std::string id;
    std::string source;
    std::string target;
    std::string type;
    PropertyMap props;
};

struct SnapshotMeta {
    std::map<std::string, int> node_label_counts;
    std::map<std::string, int> rel_type_counts;
    std::vector<std::string> property_keys;
    std::map<std::string, int> modality_counts;
    std::vector<std::string> missing_timestamp_labels;
    std::optional<std::string> min_timestamp;
    std::optional<std::string> max_timestamp;
};

// Immutable once received; a new snapshot replaces the previous one wholesale.
struct Snapshot {
    std::string generated_at;
    std::vector<GraphNode> nodes;
    std::vector<GraphEdge> edges;
    SnapshotMeta meta;
};

// Derives meta from nodes and edges (used when the payload carries none).
SnapshotMeta compute_snapshot_meta(const Snapshot& snapshot);

} // namespace graph_model
