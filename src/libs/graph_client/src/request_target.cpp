#include <graph_client/request_config.hpp>
#include <graph_util/api_url.hpp>

namespace graph_client {

const char* graph_mode_name(GraphMode mode) {
    switch (mode) {
    case GraphMode::Universe: return "universe";
    case GraphMode::Issue: return "issue";
    case GraphMode::Neo4jDefault: return "neo4j_default";
    }
    return "universe";
}

bool parse_graph_mode(const std::string& name, GraphMode& out) {
    if (name == "universe") out = GraphMode::Universe;
    else if (name == "issue") out = GraphMode::Issue;
    else if (name == "neo4j_default") out = GraphMode::Neo4jDefault;
    else return false;
    return true;
}

std::string build_request_target(const RequestConfig& config) {
    graph_util::QueryParams query;
    query.set("mode", graph_mode_name(config.mode));
    query.set("depth", std::to_string(config.depth));
    query.set("limit", std::to_string(config.filters.limit));
    if (config.root_node_id && !config.root_node_id->empty())
        query.set("rootId", *config.root_node_id);
    if (config.project_id && !config.project_id->empty())
        query.set("projectId", *config.project_id);
    if (config.filters.modalities) {
        for (const auto& modality : *config.filters.modalities)
            query.append("modalities", modality);
    }
    if (config.filters.snapshot_at && !config.filters.snapshot_at->empty())
        query.set("snapshotAt", *config.filters.snapshot_at);
    return graph_util::resolve_api_url(config.api_base, config.endpoint_path, query);
}

std::string fetch_command(const std::string& target) {
    std::string quoted;
    quoted.reserve(target.size() + 2);
    for (char c : target) {
        if (c == '\'')
            quoted += "'\\''";
        else
            quoted += c;
    }
    return "curl -sS '" + quoted + "'";
}

} // namespace graph_client
