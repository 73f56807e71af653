#include <canvas/pointer_tracker.hpp>
#include <cmath>
#include <utility>

namespace canvas {

const char* pointer_state_name(PointerState state) {
    switch (state) {
    case PointerState::Idle: return "idle";
    case PointerState::Hovering: return "hovering";
    case PointerState::Dragging: return "dragging";
    }
    return "idle";
}

PointerTracker::PointerTracker(Viewport& viewport)
    : viewport_(viewport)
{
}

std::optional<std::string> PointerTracker::pick(const Picker& picker, const graph_layout::Point& screen) const {
    if (!picker) return std::nullopt;
    return picker(viewport_.screen_to_world(screen));
}

void PointerTracker::pointer_down(const graph_layout::Point& screen) {
    state_ = PointerState::Dragging;
    start_ = screen;
    last_ = screen;
    moved_ = false;
}

void PointerTracker::pointer_move(const graph_layout::Point& screen) {
    if (state_ == PointerState::Dragging) {
        const double dx = screen.x - last_.x;
        const double dy = screen.y - last_.y;
        last_ = screen;
        if (viewport_.locked()) {
            moved_ = false;
            return;
        }
        const bool step_moved = std::abs(dx) > drag_threshold || std::abs(dy) > drag_threshold;
        const bool total_moved = std::abs(screen.x - start_.x) > drag_threshold
            || std::abs(screen.y - start_.y) > drag_threshold;
        if (step_moved || total_moved) moved_ = true;
        viewport_.pan_by(dx, dy);
        return;
    }

    // Node hover suppresses edge hover.
    std::optional<std::string> node_id = pick(pick_node_, screen);
    std::optional<std::string> edge_id;
    if (!node_id) edge_id = pick(pick_edge_, screen);
    set_hover(std::move(node_id), std::move(edge_id));
}

void PointerTracker::pointer_up(const graph_layout::Point& screen) {
    if (state_ != PointerState::Dragging) return;
    const bool was_click = !moved_;
    moved_ = false;
    state_ = (hovered_node_ || hovered_edge_) ? PointerState::Hovering : PointerState::Idle;
    if (was_click && on_select_) on_select_(pick(pick_node_, screen));
}

void PointerTracker::pointer_leave() {
    if (state_ == PointerState::Dragging) return;
    state_ = PointerState::Idle;
    set_hover(std::nullopt, std::nullopt);
}

void PointerTracker::clear_hover() {
    hovered_node_.reset();
    hovered_edge_.reset();
    if (state_ == PointerState::Hovering) state_ = PointerState::Idle;
}

bool PointerTracker::wheel(const graph_layout::Point& screen, double delta_y) {
    if (viewport_.locked() || delta_y == 0.0) return false;
    return viewport_.zoom_at(screen, std::exp(-delta_y * wheel_sensitivity));
}

void PointerTracker::set_hover(std::optional<std::string> node_id, std::optional<std::string> edge_id) {
    if (state_ != PointerState::Dragging)
        state_ = (node_id || edge_id) ? PointerState::Hovering : PointerState::Idle;
    if (node_id == hovered_node_ && edge_id == hovered_edge_) return;
    hovered_node_ = std::move(node_id);
    hovered_edge_ = std::move(edge_id);
    if (on_hover_) on_hover_(hovered_node_, hovered_edge_);
}

} // namespace canvas
