#include <canvas/canvas.hpp>
#include <graph_render/renderer.hpp>
#include <graph_render/scene_builder.hpp>
#include <graph_util/log.hpp>
#include "imgui.h"

namespace {

// Browser wheel events report ~100 units per notch.
const double wheel_units_per_notch = 100.0;

} // namespace

namespace canvas {

void GraphCanvas::rebuild_scene() {
    scene_dirty_ = false;
    if (!graph_ || !layout_) {
        scene_ = {};
        return;
    }
    graph_render::SceneInput input;
    input.graph = graph_;
    input.layout = &animator_.current();
    input.highlight = highlight_;
    input.selected_node = selection_.selected();
    input.hovered_node = selection_.hovered_node();
    input.hovered_edge = selection_.hovered_edge();
    input.label_filter = label_filter_;
    scene_ = graph_render::build_scene(input, graph_render::measure_text);
}

void GraphCanvas::handle_input(const ImVec2& origin, float region_width, float region_height) {
    ImGuiIO& io = ImGui::GetIO();
    if (!ImGui::IsMousePosValid(&io.MousePos)) {
        if (mouse_inside_ && !pointer_.captured()) {
            mouse_inside_ = false;
            pointer_.pointer_leave();
        }
        return;
    }

    const graph_layout::Point local{ io.MousePos.x - origin.x, io.MousePos.y - origin.y };
    const bool moved = io.MouseDelta.x != 0.0f || io.MouseDelta.y != 0.0f;

    // Drag keeps tracking outside the surface until release.
    if (pointer_.captured()) {
        if (moved) pointer_.pointer_move(local);
        if (ImGui::IsMouseReleased(0)) pointer_.pointer_up(local);
        return;
    }

    const bool in_region = ImGui::IsWindowHovered()
        && local.x >= 0.0 && local.x <= region_width
        && local.y >= 0.0 && local.y <= region_height;
    if (!in_region) {
        if (mouse_inside_) {
            mouse_inside_ = false;
            pointer_.pointer_leave();
        }
        return;
    }

    const bool entered = !mouse_inside_;
    mouse_inside_ = true;
    if (ImGui::IsMouseClicked(0)) {
        pointer_.pointer_down(local);
        if (ImGui::IsMouseReleased(0)) pointer_.pointer_up(local);
        return;
    }
    if (moved || entered || scene_dirty_) pointer_.pointer_move(local);
    if (io.MouseWheel != 0.0f) pointer_.wheel(local, -io.MouseWheel * wheel_units_per_notch);
}

bool GraphCanvas::update_and_draw(float region_width, float region_height, float dt) {
    if (region_width <= 0 || region_height <= 0) return false;

    const ImVec2 origin = ImGui::GetCursorScreenPos();
    if (viewport_.set_size(region_width, region_height) && !viewport_.locked())
        pending_fit_ = true;
    if (pending_fit_) {
        pending_fit_ = false;
        refit();
        graph_util::logger()->debug("View fit: scale={:.3f} pan=({:.1f}, {:.1f})",
            viewport_.state().scale, viewport_.state().pan_x, viewport_.state().pan_y);
    }

    handle_input(origin, region_width, region_height);

    if (!animator_.settled()) {
        animator_.tick(dt);
        scene_dirty_ = true;
    }
    if (scene_dirty_) rebuild_scene();

    ImDrawList* draw_list = ImGui::GetWindowDrawList();
    if (!draw_list) return true;

    graph_render::RenderTransform transform;
    transform.origin_x = origin.x;
    transform.origin_y = origin.y;
    transform.width = region_width;
    transform.height = region_height;
    transform.scale = viewport_.state().scale;
    transform.pan_x = viewport_.state().pan_x;
    transform.pan_y = viewport_.state().pan_y;
    graph_render::render_scene(draw_list, scene_, transform, highlight_fade_);
    return true;
}

} // namespace canvas
