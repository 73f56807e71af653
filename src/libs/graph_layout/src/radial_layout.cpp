#include <graph_layout/layout.hpp>
#include <algorithm>
#include <cmath>
#include <map>

namespace graph_layout {

namespace {

const double two_pi = 6.283185307179586;

bool contains(const std::vector<std::string>& values, const std::string& v) {
    return !v.empty() && std::find(values.begin(), values.end(), v) != values.end();
}

void sort_by_id(std::vector<const graph_model::GraphNode*>& nodes) {
    std::sort(nodes.begin(), nodes.end(),
        [](const graph_model::GraphNode* a, const graph_model::GraphNode* b) { return a->id < b->id; });
}

void place_on_ring(const std::vector<const graph_model::GraphNode*>& sorted,
    double radius,
    double jitter,
    LayoutMap& out)
{
    const double n = static_cast<double>(sorted.size());
    for (std::size_t idx = 0; idx < sorted.size(); ++idx) {
        const double i = static_cast<double>(idx);
        const double angle = i / n * two_pi + jitter * std::sin(i);
        out[sorted[idx]->id] = Point{ std::cos(angle) * radius, std::sin(angle) * radius };
    }
}

} // namespace

LayoutMap radial_layout(const std::vector<graph_model::GraphNode>& nodes,
    const RadialLayoutConfig& config)
{
    LayoutMap out;
    if (nodes.empty()) return out;

    std::vector<const graph_model::GraphNode*> center;
    std::map<std::string, std::vector<const graph_model::GraphNode*>> groups;
    for (const auto& node : nodes) {
        if (contains(config.center_labels, node.label) || contains(config.center_modalities, node.modality)) {
            center.push_back(&node);
            continue;
        }
        std::string key = !node.modality.empty() ? node.modality
            : !node.label.empty() ? node.label
            : std::string("Other");
        groups[key].push_back(&node);
    }

    if (center.empty()) {
        std::vector<const graph_model::GraphNode*> all;
        all.reserve(nodes.size());
        for (const auto& node : nodes) all.push_back(&node);
        sort_by_id(all);
        place_on_ring(all, spacing::fallback_ring_radius, 0.0, out);
        return out;
    }

    sort_by_id(center);
    if (center.size() == 1) {
        out[center.front()->id] = Point{ 0.0, 0.0 };
    } else {
        place_on_ring(center, spacing::center_ring_radius, 0.0, out);
    }

    // std::map iterates keys in lexicographic order.
    std::size_t group_index = 0;
    for (auto& [key, members] : groups) {
        sort_by_id(members);
        const double radius = spacing::first_ring_radius + spacing::ring_step * static_cast<double>(group_index);
        place_on_ring(members, radius, spacing::ring_jitter, out);
        ++group_index;
    }
    return out;
}

} // namespace graph_layout
