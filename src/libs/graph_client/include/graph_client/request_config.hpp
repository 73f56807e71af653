#pragma once

#include <optional>
#include <string>
#include <vector>

namespace graph_client {

enum class GraphMode { Universe, Issue, Neo4jDefault };

const char* graph_mode_name(GraphMode mode);
bool parse_graph_mode(const std::string& name, GraphMode& out);

constexpr const char* default_endpoint_path = "/api/brain/universe";
constexpr int default_limit = 600;
constexpr int default_depth = 2;
constexpr int default_timeout_seconds = 30;

struct RequestFilters {
    // nullopt = no filter, show all
    std::optional<std::vector<std::string>> modalities;
    int limit = default_limit;
    std::optional<std::string> snapshot_at;

    bool operator==(const RequestFilters& o) const {
        return modalities == o.modalities && limit == o.limit && snapshot_at == o.snapshot_at;
    }
    bool operator!=(const RequestFilters& o) const { return !(*this == o); }
};

struct RequestConfig {
    GraphMode mode = GraphMode::Universe;
    std::optional<std::string> root_node_id;
    int depth = default_depth;
    std::optional<std::string> project_id;
    RequestFilters filters;
    std::string api_base;
    std::string endpoint_path = default_endpoint_path;
    int timeout_seconds = default_timeout_seconds;
    // Bumped by manual refresh so identical configs still re-issue.
    int refresh_key = 0;
};

// Fully resolved URL with parameters in a fixed order:
// mode, depth, limit, rootId, projectId, modalities (repeated), snapshotAt.
std::string build_request_target(const RequestConfig& config);

// Reproducible shell command for the diagnostics surface.
std::string fetch_command(const std::string& target);

} // namespace graph_client
