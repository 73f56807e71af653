#pragma once

#include <graph_layout/types.hpp>
#include <graph_util/node_colors.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace graph_render {

// Everything below is in world units; the renderer applies the view transform.

namespace metrics {

constexpr float base_node_radius = 7.0f;
constexpr float max_degree_bonus = 4.0f;
constexpr float dimmed_alpha = 0.25f;
constexpr float anchor_width_boost = 0.35f;
constexpr float hovered_width_boost = 0.9f;
constexpr float recent_width_boost = 1.0f;

constexpr float edge_label_font = 9.0f;
constexpr float edge_label_lift = 4.0f;
constexpr float title_font = 11.0f;
constexpr float title_offset = 6.0f;
constexpr float title_lift = 4.0f;
constexpr std::size_t title_max_chars = 32;

constexpr float tooltip_font = 10.0f;
constexpr float tooltip_padding_x = 8.0f;
constexpr float tooltip_padding_y = 6.0f;
constexpr float tooltip_line_height = 12.0f;
constexpr float tooltip_corner_radius = 6.0f;
constexpr float anchor_tooltip_offset = 18.0f;
constexpr float edge_tooltip_offset_x = 12.0f;
constexpr float edge_tooltip_gap = 4.0f;
constexpr std::size_t tooltip_max_lines = 5;

} // namespace metrics

struct SceneRing {
    float radius = 0;
    float width = 1;
    graph_util::Rgba color;
    bool recent = false; // fades with the highlight
};

struct SceneNode {
    std::string id;
    graph_layout::Point center;
    float radius = metrics::base_node_radius;
    graph_util::Rgba fill;
    bool dimmed = false;
    std::vector<SceneRing> rings;
    std::optional<std::string> title;
    graph_layout::Point title_pos;
};

struct SceneEdge {
    std::string id;
    graph_layout::Point from;
    graph_layout::Point to;
    graph_util::Rgba color;
    float width = 1.5f;
    // Recent edges blend from these toward color/width as the highlight fades in.
    bool recent = false;
    graph_util::Rgba base_color;
    float base_width = 1.5f;
    std::string type_label;
    graph_layout::Point label_pos;
};

struct SceneTooltip {
    graph_layout::Point origin; // top-left
    float width = 0;
    float height = 0;
    std::vector<std::string> lines;
};

struct Scene {
    std::vector<SceneEdge> edges;
    std::vector<SceneNode> nodes;
    std::vector<SceneTooltip> tooltips;
    bool empty() const { return nodes.empty(); }
};

} // namespace graph_render
