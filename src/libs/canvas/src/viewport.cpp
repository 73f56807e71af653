#include <canvas/viewport.hpp>
#include <algorithm>
#include <cmath>

namespace canvas {

double clamp_scale(double scale) {
    return std::clamp(scale, Viewport::min_scale, Viewport::max_scale);
}

bool Viewport::set_size(double width, double height) {
    if (width == width_ && height == height_) return false;
    width_ = width;
    height_ = height;
    return true;
}

bool Viewport::pan_by(double dx, double dy) {
    if (locked_) return false;
    ViewState next = state_;
    next.pan_x += dx / state_.scale;
    next.pan_y += dy / state_.scale;
    set_state(next);
    return true;
}

bool Viewport::zoom_at(const graph_layout::Point& screen_point, double factor) {
    if (locked_ || !std::isfinite(factor) || factor <= 0.0) return false;
    const double next_scale = clamp_scale(state_.scale * factor);
    if (next_scale == state_.scale) return false;

    const graph_layout::Point world = screen_to_world(screen_point);
    const double cursor_x = screen_point.x - width_ * 0.5;
    const double cursor_y = screen_point.y - height_ * 0.5;
    ViewState next;
    next.scale = next_scale;
    next.pan_x = cursor_x / next_scale - world.x;
    next.pan_y = cursor_y / next_scale - world.y;
    set_state(next);
    return true;
}

void Viewport::focus_nodes(const graph_layout::LayoutMap& layout, const std::vector<std::string>& ids) {
    std::vector<graph_layout::Point> points;
    if (ids.empty()) {
        points.reserve(layout.size());
        for (const auto& [id, p] : layout) points.push_back(p);
    } else {
        for (const auto& id : ids) {
            auto it = layout.find(id);
            if (it != layout.end()) points.push_back(it->second);
        }
    }
    if (points.empty()) {
        reset();
        return;
    }

    const graph_layout::Bounds b = graph_layout::compute_bounds(points);
    const double bbox_w = std::max(b.max_x - b.min_x, 1.0);
    const double bbox_h = std::max(b.max_y - b.min_y, 1.0);
    const double avail_w = width_ - 2.0 * fit_padding;
    const double avail_h = height_ - 2.0 * fit_padding;
    double scale = clamp_scale(std::min(avail_w / bbox_w, avail_h / bbox_h));
    if (!std::isfinite(scale)) scale = 1.0;

    ViewState next;
    next.scale = scale;
    next.pan_x = -(b.min_x + b.max_x) * 0.5;
    next.pan_y = -(b.min_y + b.max_y) * 0.5;
    set_state(next);
}

void Viewport::reset() {
    set_state(ViewState{});
}

graph_layout::Point Viewport::screen_to_world(const graph_layout::Point& screen) const {
    return {
        (screen.x - width_ * 0.5) / state_.scale - state_.pan_x,
        (screen.y - height_ * 0.5) / state_.scale - state_.pan_y
    };
}

graph_layout::Point Viewport::world_to_screen(const graph_layout::Point& world) const {
    return {
        (world.x + state_.pan_x) * state_.scale + width_ * 0.5,
        (world.y + state_.pan_y) * state_.scale + height_ * 0.5
    };
}

void Viewport::set_state(const ViewState& next) {
    if (next == state_) return;
    state_ = next;
    changed_.notify(state_);
}

} // namespace canvas
