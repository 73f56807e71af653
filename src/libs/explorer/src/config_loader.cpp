#include <explorer/explorer_config.hpp>
#include <graph_util/log.hpp>
#include <nlohmann/json.hpp>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <fstream>
#include <iterator>

namespace explorer {

namespace {

// Throws nlohmann::json::type_error when the key is present with the wrong type.
template <typename T>
void read(const nlohmann::json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) out = it->get<T>();
}

template <typename T>
void read(const nlohmann::json& j, const char* key, std::optional<T>& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) out = it->get<T>();
}

bool parse_config(const nlohmann::json& j, ExplorerConfig& c, std::string* error) {
    if (!j.is_object()) {
        if (error) *error = "config root must be an object";
        return false;
    }
    read(j, "title", c.title);
    read(j, "api_base", c.api_base);
    read(j, "endpoint_path", c.endpoint_path);
    read(j, "depth", c.depth);
    read(j, "project_id", c.project_id);
    read(j, "root_node_id", c.root_node_id);
    read(j, "limit", c.limit);
    read(j, "modalities", c.modalities);
    read(j, "snapshot_at", c.snapshot_at);
    read(j, "lock_viewport", c.lock_viewport);
    read(j, "enable_time_controls", c.enable_time_controls);
    read(j, "timeout_seconds", c.timeout_seconds);
    read(j, "log_level", c.log_level);
    read(j, "offline", c.offline);
    read(j, "snapshot_file", c.snapshot_file);
    read(j, "diagnostics", c.show_diagnostics);

    std::string mode;
    read(j, "mode", mode);
    if (!mode.empty() && !graph_client::parse_graph_mode(mode, c.mode)) {
        if (error) *error = "unknown mode '" + mode + "'";
        return false;
    }
    std::string layout;
    read(j, "layout", layout);
    if (!layout.empty() && !graph_layout::parse_layout_strategy(layout, c.layout)) {
        if (error) *error = "unknown layout '" + layout + "'";
        return false;
    }
    if (c.timeout_seconds <= 0) {
        if (error) *error = "timeout_seconds must be positive";
        return false;
    }

    if (auto it = j.find("radial_layout"); it != j.end() && it->is_object()) {
        read(*it, "center_labels", c.layout_config.radial.center_labels);
        read(*it, "center_modalities", c.layout_config.radial.center_modalities);
    }
    if (auto it = j.find("column_layout"); it != j.end() && it->is_object()) {
        read(*it, "order", c.layout_config.column.order);
        read(*it, "aliases", c.layout_config.column.aliases);
        read(*it, "fallback", c.layout_config.column.fallback);
    }
    return true;
}

} // namespace

bool time_controls_enabled(const ExplorerConfig& config) {
    if (config.enable_time_controls) return *config.enable_time_controls;
    return config.mode != graph_client::GraphMode::Issue && !config.lock_viewport;
}

std::optional<int> parse_int_option(const std::string& text) {
    if (text.empty()) return std::nullopt;
    const char* begin = text.c_str();
    char* end = nullptr;
    errno = 0;
    const long value = std::strtol(begin, &end, 10);
    if (end == begin || *end != '\0' || errno == ERANGE) return std::nullopt;
    if (value < INT_MIN || value > INT_MAX) return std::nullopt;
    return static_cast<int>(value);
}

std::optional<ExplorerConfig> load_explorer_config_from_json(const std::string& text, std::string* error) {
    try {
        nlohmann::json j = nlohmann::json::parse(text);
        ExplorerConfig config;
        if (!parse_config(j, config, error)) return std::nullopt;
        return config;
    } catch (const nlohmann::json::exception& e) {
        if (error) *error = e.what();
        graph_util::logger()->warn("Config JSON rejected: {}", e.what());
        return std::nullopt;
    }
}

std::optional<ExplorerConfig> load_explorer_config_from_json_file(const std::string& path, std::string* error) {
    std::ifstream f(path);
    if (!f) {
        if (error) *error = "cannot open " + path;
        return std::nullopt;
    }
    std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return load_explorer_config_from_json(text, error);
}

} // namespace explorer
