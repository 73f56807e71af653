#pragma once

#include <graph_render/scene.hpp>
#include <string>

struct ImDrawList;

namespace graph_render {

// Placement of the drawing surface on screen plus the view transform:
// local = (world + pan) * scale + size / 2, screen = origin + local.
struct RenderTransform {
    float origin_x = 0;
    float origin_y = 0;
    float width = 0;
    float height = 0;
    double scale = 1.0;
    double pan_x = 0.0;
    double pan_y = 0.0;
};

// Draw order: background, edges, nodes, tooltips. highlight_fade (1..0) scales
// the recent-entity emphasis. Tooltips are shifted to stay inside the surface.
// Reads the scene only.
void render_scene(ImDrawList* draw_list,
    const Scene& scene,
    const RenderTransform& transform,
    float highlight_fade = 1.0f);

// ImGui-backed measure for build_scene; requires an active ImGui frame.
float measure_text(const std::string& text, float font_size);

} // namespace graph_render
