#pragma once

#include <graph_client/request_config.hpp>
#include <graph_layout/layout_config.hpp>
#include <graph_layout/types.hpp>
#include <optional>
#include <string>
#include <vector>

namespace explorer {

// Host-level settings: a JSON file (all keys optional) overlaid by command-line flags.
struct ExplorerConfig {
    std::string title;
    std::string api_base;
    std::string endpoint_path = graph_client::default_endpoint_path;
    graph_client::GraphMode mode = graph_client::GraphMode::Universe;
    int depth = graph_client::default_depth;
    std::optional<std::string> project_id;
    std::optional<std::string> root_node_id;
    int limit = graph_client::default_limit;
    std::optional<std::vector<std::string>> modalities;
    std::optional<std::string> snapshot_at;
    graph_layout::LayoutStrategy layout = graph_layout::LayoutStrategy::Radial;
    graph_layout::LayoutConfig layout_config;
    bool lock_viewport = false;
    // Unset: on unless mode is issue or the viewport is locked.
    std::optional<bool> enable_time_controls;
    int timeout_seconds = graph_client::default_timeout_seconds;
    std::string log_level = "info";

    bool offline = false;
    std::string snapshot_file;
    bool show_diagnostics = false;
};

bool time_controls_enabled(const ExplorerConfig& config);

// Strict decimal integer for command-line values such as --limit. Empty text, trailing
// characters and values outside the int range give nullopt.
std::optional<int> parse_int_option(const std::string& text);

// Unknown keys are ignored; a present key with the wrong type or value is an error.
std::optional<ExplorerConfig> load_explorer_config_from_json(const std::string& text, std::string* error = nullptr);
std::optional<ExplorerConfig> load_explorer_config_from_json_file(const std::string& path, std::string* error = nullptr);

} // namespace explorer
