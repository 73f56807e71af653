#include <graph_model/types.hpp>
#include <graph_util/time_format.hpp>
#include <set>

namespace graph_model {

SnapshotMeta compute_snapshot_meta(const Snapshot& snapshot) {
    SnapshotMeta meta;
    std::set<std::string> keys;
    std::set<std::string> missing;
    std::optional<std::int64_t> min_ms;
    std::optional<std::int64_t> max_ms;

    for (const auto& node : snapshot.nodes) {
        ++meta.node_label_counts[node.label];
        if (!node.modality.empty()) ++meta.modality_counts[node.modality];
        for (const auto& [key, value] : node.props) keys.insert(key);

        auto ms = graph_util::parse_iso8601_ms(node.created_at);
        if (!ms) {
            missing.insert(node.label);
            continue;
        }
        if (!min_ms || *ms < *min_ms) min_ms = ms;
        if (!max_ms || *ms > *max_ms) max_ms = ms;
    }
    for (const auto& edge : snapshot.edges) {
        ++meta.rel_type_counts[edge.type.empty() ? std::string("RELATED") : edge.type];
    }

    meta.property_keys.assign(keys.begin(), keys.end());
    meta.missing_timestamp_labels.assign(missing.begin(), missing.end());
    if (min_ms) meta.min_timestamp = graph_util::format_iso8601_ms(*min_ms);
    if (max_ms) meta.max_timestamp = graph_util::format_iso8601_ms(*max_ms);
    return meta;
}

} // namespace graph_model
