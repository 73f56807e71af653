#include <graph_layout/layout.hpp>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <map>
#include <unordered_map>

namespace graph_layout {

namespace {

std::string to_lower(const std::string& s) {
    std::string out = s;
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

bool is_column(const ColumnLayoutConfig& config, const std::string& key) {
    return !key.empty() && std::find(config.order.begin(), config.order.end(), key) != config.order.end();
}

std::string alias_of(const ColumnLayoutConfig& config, const std::string& key) {
    if (key.empty()) return {};
    auto it = config.aliases.find(key);
    return it == config.aliases.end() ? std::string() : it->second;
}

} // namespace

double deterministic_jitter(const std::string& key, double spread) {
    std::uint32_t hash = 0;
    for (unsigned char c : key)
        hash = hash * 31u + c;
    const double normalized = static_cast<double>(hash % 1000u) / 1000.0 - 0.5;
    return normalized * spread;
}

std::string column_key(const graph_model::GraphNode& node, const ColumnLayoutConfig& config) {
    const std::string label = to_lower(node.label);
    const std::string modality = to_lower(node.modality);
    if (is_column(config, modality)) return modality;

    std::string alias = alias_of(config, modality);
    if (alias.empty()) alias = alias_of(config, label);
    if (is_column(config, alias)) return alias;

    if (is_column(config, label)) return label;
    return config.fallback;
}

LayoutMap column_layout(const std::vector<graph_model::GraphNode>& nodes,
    const ColumnLayoutConfig& config)
{
    LayoutMap out;
    std::map<std::string, std::vector<const graph_model::GraphNode*>> groups;
    for (const auto& node : nodes)
        groups[column_key(node, config)].push_back(&node);

    std::vector<std::string> columns;
    for (const auto& key : config.order) {
        if (groups.count(key) && std::find(columns.begin(), columns.end(), key) == columns.end())
            columns.push_back(key);
    }
    // Remaining keys come out of std::map already sorted.
    for (const auto& [key, members] : groups) {
        if (!is_column(config, key)) columns.push_back(key);
    }

    const double base_offset = (static_cast<double>(columns.size()) - 1.0) / 2.0;
    for (std::size_t column = 0; column < columns.size(); ++column) {
        auto& members = groups[columns[column]];
        std::sort(members.begin(), members.end(),
            [](const graph_model::GraphNode* a, const graph_model::GraphNode* b) { return a->id < b->id; });

        const double column_x = (static_cast<double>(column) - base_offset) * spacing::column_spacing;
        const double start_y = -((static_cast<double>(members.size()) - 1.0) / 2.0) * spacing::row_spacing;
        for (std::size_t row = 0; row < members.size(); ++row) {
            const std::string& id = members[row]->id;
            const double jitter_x = deterministic_jitter(id + ":x", spacing::column_jitter_spread);
            const double jitter_y = deterministic_jitter(id + ":y", spacing::column_jitter_spread);
            out[id] = Point{
                column_x + jitter_x,
                start_y + static_cast<double>(row) * spacing::row_spacing + jitter_y
            };
        }
    }
    return out;
}

LayoutMap compute_layout(const std::vector<graph_model::GraphNode>& nodes,
    LayoutStrategy strategy,
    const LayoutConfig& config)
{
    if (strategy == LayoutStrategy::Column) return column_layout(nodes, config.column);
    return radial_layout(nodes, config.radial);
}

} // namespace graph_layout
