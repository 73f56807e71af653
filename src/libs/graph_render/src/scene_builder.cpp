#include <graph_render/scene_builder.hpp>
#include <graph_render/edge_styles.hpp>
#include <graph_util/labels.hpp>
#include <algorithm>
#include <cmath>
#include <utility>

namespace graph_render {

namespace {

const graph_layout::Point* find_point(const graph_layout::LayoutMap& layout, const std::string& id) {
    auto it = layout.find(id);
    return it == layout.end() ? nullptr : &it->second;
}

std::string title_of(const graph_model::GraphIndex& graph, const std::string& id) {
    const graph_model::GraphNode* node = graph.find_node(id);
    if (!node || node->title.empty()) return id;
    return node->title;
}

std::string relation_of(const graph_model::GraphEdge& edge) {
    return edge.type.empty() ? std::string("RELATED") : edge.type;
}

SceneTooltip make_tooltip(std::vector<std::string> lines, const TextMeasure& measure) {
    SceneTooltip tip;
    float widest = 0.f;
    for (const auto& line : lines)
        widest = std::max(widest, measure ? measure(line, metrics::tooltip_font) : 0.f);
    tip.width = widest + 2.f * metrics::tooltip_padding_x;
    tip.height = static_cast<float>(lines.size()) * metrics::tooltip_line_height + 2.f * metrics::tooltip_padding_y;
    tip.lines = std::move(lines);
    return tip;
}

} // namespace

float node_radius(std::size_t degree) {
    return metrics::base_node_radius + std::min(metrics::max_degree_bonus, std::sqrt(static_cast<float>(degree)));
}

Scene build_scene(const SceneInput& input, const TextMeasure& measure) {
    Scene scene;
    if (!input.graph || !input.layout) return scene;
    const graph_model::GraphIndex& graph = *input.graph;
    const graph_layout::LayoutMap& layout = *input.layout;

    const std::optional<std::string>& anchor = input.hovered_node ? input.hovered_node : input.selected_node;
    const bool anchor_known = anchor && graph.contains_node(*anchor);
    const auto& anchor_neighbors = anchor_known ? graph.neighbors(*anchor) : graph.neighbors(std::string());

    auto is_recent_node = [&](const std::string& id) { return input.highlight && input.highlight->has_node(id); };
    auto is_recent_edge = [&](const std::string& id) { return input.highlight && input.highlight->has_edge(id); };

    std::optional<SceneTooltip> edge_tooltip;
    scene.edges.reserve(graph.edges().size());
    for (const auto* edge : graph.edges()) {
        const graph_layout::Point* source = find_point(layout, edge->source);
        const graph_layout::Point* target = find_point(layout, edge->target);
        if (!source || !target) continue;

        const bool touches_anchor = anchor_known
            && (edge->source == *anchor || edge->target == *anchor
                || anchor_neighbors.count(edge->source) || anchor_neighbors.count(edge->target));
        const bool hovered = input.hovered_edge && *input.hovered_edge == edge->id;
        const EdgeStyle base = edge_style_for(edge->type);

        SceneEdge out;
        out.id = edge->id;
        out.from = *source;
        out.to = *target;
        out.base_color = base.color;
        out.base_width = base.width;
        if (hovered) {
            out.base_color = palette::hovered_edge;
            out.base_width = base.width + metrics::hovered_width_boost;
        } else if (touches_anchor) {
            out.base_color = palette::anchor_edge;
            out.base_width = base.width + metrics::anchor_width_boost;
        }
        out.color = out.base_color;
        out.width = out.base_width;
        if (is_recent_edge(edge->id)) {
            out.recent = true;
            out.color = palette::recent_edge;
            out.width = base.width + metrics::recent_width_boost;
        }

        const graph_layout::Point mid{ (source->x + target->x) * 0.5, (source->y + target->y) * 0.5 };
        out.type_label = edge->type;
        out.label_pos = { mid.x, mid.y - metrics::edge_label_lift };

        if (hovered) {
            SceneTooltip tip = make_tooltip(
                { title_of(graph, edge->source), relation_of(*edge) + " -> " + title_of(graph, edge->target) },
                measure);
            tip.origin = { mid.x + metrics::edge_tooltip_offset_x, mid.y - (tip.height + metrics::edge_tooltip_gap) };
            edge_tooltip = std::move(tip);
        }
        scene.edges.push_back(std::move(out));
    }

    scene.nodes.reserve(graph.nodes().size());
    for (const auto* node : graph.nodes()) {
        const graph_layout::Point* p = find_point(layout, node->id);
        if (!p) continue;

        SceneNode out;
        out.id = node->id;
        out.center = *p;
        out.radius = node_radius(graph.degree(node->id));
        out.fill = graph_util::color_for_node(node->label, node->modality);

        const bool filtered_out = input.label_filter && node->label != *input.label_filter;
        const bool outside_anchor = anchor_known && node->id != *anchor && !anchor_neighbors.count(node->id);
        out.dimmed = filtered_out || outside_anchor;

        const bool selected = input.selected_node && *input.selected_node == node->id;
        const bool hovered = input.hovered_node && *input.hovered_node == node->id;
        if (is_recent_node(node->id))
            out.rings.push_back({ out.radius + 3.f, 1.5f, palette::recent_ring, true });
        if (selected)
            out.rings.push_back({ out.radius + 4.f, 2.4f, palette::selected_ring, false });
        if (hovered)
            out.rings.push_back({ out.radius + 3.f, 2.0f, palette::hovered_ring, false });

        if ((selected || hovered) && !node->title.empty()) {
            out.title = graph_util::truncate_label(node->title, metrics::title_max_chars);
            out.title_pos = { p->x + out.radius + metrics::title_offset, p->y - out.radius - metrics::title_lift };
        }
        scene.nodes.push_back(std::move(out));
    }

    if (anchor_known) {
        const graph_layout::Point* anchor_pos = find_point(layout, *anchor);
        std::vector<std::string> lines;
        for (const auto* edge : graph.incident_edges(*anchor)) {
            if (lines.size() >= metrics::tooltip_max_lines) break;
            const std::string& neighbor = edge->source == *anchor ? edge->target : edge->source;
            lines.push_back(relation_of(*edge) + " -> " + title_of(graph, neighbor));
        }
        if (anchor_pos && !lines.empty()) {
            SceneTooltip tip = make_tooltip(std::move(lines), measure);
            tip.origin = { anchor_pos->x + metrics::anchor_tooltip_offset, anchor_pos->y - tip.height };
            scene.tooltips.push_back(std::move(tip));
        }
    }
    if (edge_tooltip) scene.tooltips.push_back(std::move(*edge_tooltip));
    return scene;
}

} // namespace graph_render
