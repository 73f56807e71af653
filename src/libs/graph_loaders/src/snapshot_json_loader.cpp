#include <graph_loaders/snapshot_json.hpp>
#include <graph_util/log.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <limits>
#include <unordered_set>

namespace graph_loaders {

namespace {

std::string string_or(const nlohmann::json& j, const char* key, const std::string& fallback) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

graph_model::PropertyMap parse_props(const nlohmann::json& j) {
    graph_model::PropertyMap props;
    auto it = j.find("props");
    if (it == j.end() || !it->is_object()) return props;
    for (auto p = it->begin(); p != it->end(); ++p) {
        if (p->is_null()) continue;
        props[p.key()] = p->is_string() ? p->get<std::string>() : p->dump();
    }
    return props;
}

std::map<std::string, int> parse_counts(const nlohmann::json& meta, const char* key) {
    std::map<std::string, int> counts;
    auto it = meta.find(key);
    if (it == meta.end() || !it->is_object()) return counts;
    // Non-integer, negative and out-of-int-range counts are skipped.
    for (auto c = it->begin(); c != it->end(); ++c) {
        if (c->is_number_unsigned()) {
            const auto value = c->get<std::uint64_t>();
            if (value <= static_cast<std::uint64_t>(std::numeric_limits<int>::max()))
                counts[c.key()] = static_cast<int>(value);
        } else if (c->is_number_integer()) {
            const auto value = c->get<std::int64_t>();
            if (value >= 0 && value <= std::numeric_limits<int>::max())
                counts[c.key()] = static_cast<int>(value);
        }
    }
    return counts;
}

std::vector<std::string> parse_strings(const nlohmann::json& meta, const char* key) {
    std::vector<std::string> out;
    auto it = meta.find(key);
    if (it == meta.end() || !it->is_array()) return out;
    for (const auto& s : *it) {
        if (s.is_string()) out.push_back(s.get<std::string>());
    }
    return out;
}

std::optional<std::string> optional_string(const nlohmann::json& meta, const char* key) {
    auto it = meta.find(key);
    if (it == meta.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

graph_model::SnapshotMeta parse_meta(const nlohmann::json& meta) {
    graph_model::SnapshotMeta m;
    m.node_label_counts = parse_counts(meta, "nodeLabelCounts");
    m.rel_type_counts = parse_counts(meta, "relTypeCounts");
    m.property_keys = parse_strings(meta, "propertyKeys");
    m.modality_counts = parse_counts(meta, "modalityCounts");
    m.missing_timestamp_labels = parse_strings(meta, "missingTimestampLabels");
    m.min_timestamp = optional_string(meta, "minTimestamp");
    m.max_timestamp = optional_string(meta, "maxTimestamp");
    return m;
}

std::optional<graph_model::Snapshot> parse_json(const nlohmann::json& j, std::string* error) {
    if (!j.is_object() || !j.contains("nodes") || !j["nodes"].is_array()) {
        if (error) *error = "payload has no nodes array";
        return std::nullopt;
    }

    graph_model::Snapshot s;
    s.generated_at = string_or(j, "generatedAt", "");

    std::unordered_set<std::string> node_ids;
    for (const auto& n : j["nodes"]) {
        if (!n.is_object() || !n.contains("id") || !n["id"].is_string()) continue;
        graph_model::GraphNode node;
        node.id = n["id"].get<std::string>();
        if (!node_ids.insert(node.id).second) continue;
        node.label = string_or(n, "label", "Node");
        node.modality = string_or(n, "modality", "");
        node.title = string_or(n, "title", node.id);
        node.created_at = string_or(n, "createdAt", "");
        node.updated_at = string_or(n, "updatedAt", "");
        node.props = parse_props(n);
        s.nodes.push_back(std::move(node));
    }

    std::size_t dropped = 0;
    if (j.contains("edges") && j["edges"].is_array()) {
        for (const auto& e : j["edges"]) {
            if (!e.is_object()) continue;
            graph_model::GraphEdge edge;
            edge.source = string_or(e, "source", "");
            edge.target = string_or(e, "target", "");
            if (edge.source.empty() || edge.target.empty()) continue;
            if (!node_ids.count(edge.source) || !node_ids.count(edge.target)) {
                ++dropped;
                continue;
            }
            edge.type = string_or(e, "type", "");
            edge.id = string_or(e, "id", edge.source + "|" + edge.type + "|" + edge.target);
            edge.props = parse_props(e);
            s.edges.push_back(std::move(edge));
        }
    }
    if (dropped > 0)
        graph_util::logger()->debug("Dropped {} edges with unknown endpoints", dropped);

    if (j.contains("meta") && j["meta"].is_object())
        s.meta = parse_meta(j["meta"]);
    else
        s.meta = graph_model::compute_snapshot_meta(s);
    return s;
}

} // namespace

std::optional<graph_model::Snapshot> parse_snapshot_json(const std::string& text, std::string* error) {
    try {
        nlohmann::json j = nlohmann::json::parse(text);
        return parse_json(j, error);
    } catch (const nlohmann::json::exception& e) {
        if (error) *error = e.what();
        graph_util::logger()->warn("Snapshot JSON rejected: {}", e.what());
        return std::nullopt;
    }
}

std::optional<graph_model::Snapshot> load_snapshot_from_json(std::istream& in, std::string* error) {
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return parse_snapshot_json(text, error);
}

std::optional<graph_model::Snapshot> load_snapshot_from_json_file(const std::string& path, std::string* error) {
    std::ifstream f(path);
    if (!f) {
        if (error) *error = "cannot open " + path;
        return std::nullopt;
    }
    return load_snapshot_from_json(f, error);
}

} // namespace graph_loaders
