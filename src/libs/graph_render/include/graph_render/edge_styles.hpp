#pragma once

#include <graph_util/node_colors.hpp>
#include <string>

namespace graph_render {

struct EdgeStyle {
    graph_util::Rgba color;
    float width = 1.5f;
};

// Looked up by trimmed, upper-cased relationship type; unknown types get the default style.
EdgeStyle edge_style_for(const std::string& type);
EdgeStyle default_edge_style();

namespace palette {

constexpr graph_util::Rgba background{31, 36, 48, 1.0f};
constexpr graph_util::Rgba recent_edge{248, 250, 252, 0.95f};
constexpr graph_util::Rgba hovered_edge{248, 250, 252, 0.8f};
constexpr graph_util::Rgba anchor_edge{248, 113, 38, 0.65f};
constexpr graph_util::Rgba edge_label{148, 163, 184, 0.8f};
constexpr graph_util::Rgba recent_ring{248, 250, 252, 0.9f};
constexpr graph_util::Rgba selected_ring{249, 115, 22, 1.0f};
constexpr graph_util::Rgba hovered_ring{226, 232, 240, 0.9f};
constexpr graph_util::Rgba title_text{226, 232, 240, 0.95f};
constexpr graph_util::Rgba title_outline{15, 23, 42, 0.75f};
constexpr graph_util::Rgba tooltip_fill{15, 23, 42, 0.92f};
constexpr graph_util::Rgba tooltip_border{148, 163, 184, 0.6f};
constexpr graph_util::Rgba tooltip_text{226, 232, 240, 0.92f};
constexpr graph_util::Rgba placeholder_text{148, 163, 184, 1.0f};

} // namespace palette

} // namespace graph_render
