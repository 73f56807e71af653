#pragma once

#include <graph_layout/types.hpp>
#include <graph_util/change_notifier.hpp>
#include <string>
#include <vector>

namespace canvas {

struct ViewState {
    double scale = 1.0;
    double pan_x = 0.0;
    double pan_y = 0.0;

    bool operator==(const ViewState& o) const { return scale == o.scale && pan_x == o.pan_x && pan_y == o.pan_y; }
    bool operator!=(const ViewState& o) const { return !(*this == o); }
};

// Owns the pan/zoom transform of one drawing surface. Screen coordinates are
// local to the surface: screen = (world + pan) * scale + size / 2.
class Viewport {
public:
    static constexpr double min_scale = 0.6;
    static constexpr double max_scale = 4.0;
    static constexpr double fit_padding = 60.0;

    Viewport() = default;
    Viewport(double width, double height) : width_(width), height_(height) {}

    // Returns true when the size changed.
    bool set_size(double width, double height);
    double width() const { return width_; }
    double height() const { return height_; }

    const ViewState& state() const { return state_; }

    // Locked viewports ignore pan_by/zoom_at; focus_nodes still applies.
    void set_locked(bool locked) { locked_ = locked; }
    bool locked() const { return locked_; }

    // Screen delta in pixels. Returns false when locked.
    bool pan_by(double dx, double dy);
    // Keeps the world point under screen_point fixed. Returns false when locked
    // or when the clamped scale does not change.
    bool zoom_at(const graph_layout::Point& screen_point, double factor);

    // Fits the bounding box of the given ids (all laid out nodes when ids is empty)
    // inside the surface minus fit_padding on every side. Resets to the default
    // view when nothing resolves.
    void focus_nodes(const graph_layout::LayoutMap& layout, const std::vector<std::string>& ids = {});
    void reset();

    graph_layout::Point screen_to_world(const graph_layout::Point& screen) const;
    graph_layout::Point world_to_screen(const graph_layout::Point& world) const;

    graph_util::ChangeNotifier<const ViewState&>& changed() { return changed_; }

private:
    void set_state(const ViewState& next);

    double width_ = 640.0;
    double height_ = 520.0;
    ViewState state_;
    bool locked_ = false;
    graph_util::ChangeNotifier<const ViewState&> changed_;
};

double clamp_scale(double scale);

} // namespace canvas
