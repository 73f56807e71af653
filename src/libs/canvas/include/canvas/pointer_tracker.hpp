#pragma once

#include <canvas/viewport.hpp>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace canvas {

enum class PointerState { Idle, Hovering, Dragging };

const char* pointer_state_name(PointerState state);

// Pointer state machine for one surface. Distinguishes drag-pan from
// click-select and resolves hover. All points are surface-local screen pixels.
class PointerTracker {
public:
    using Picker = std::function<std::optional<std::string>(const graph_layout::Point& world)>;
    using SelectCallback = std::function<void(const std::optional<std::string>& node_id)>;
    using HoverCallback = std::function<void(const std::optional<std::string>& node_id,
        const std::optional<std::string>& edge_id)>;

    static constexpr double drag_threshold = 1.0;
    static constexpr double wheel_sensitivity = 0.001;

    explicit PointerTracker(Viewport& viewport);

    void set_node_picker(Picker picker) { pick_node_ = std::move(picker); }
    void set_edge_picker(Picker picker) { pick_edge_ = std::move(picker); }
    void set_on_select(SelectCallback cb) { on_select_ = std::move(cb); }
    void set_on_hover(HoverCallback cb) { on_hover_ = std::move(cb); }

    void pointer_down(const graph_layout::Point& screen);
    void pointer_move(const graph_layout::Point& screen);
    void pointer_up(const graph_layout::Point& screen);
    // Ignored while the pointer is captured by a drag.
    void pointer_leave();
    // Forgets the hovered ids without firing the hover callback.
    void clear_hover();
    // Browser-style wheel delta (positive = scroll down = zoom out).
    bool wheel(const graph_layout::Point& screen, double delta_y);

    PointerState state() const { return state_; }
    bool captured() const { return state_ == PointerState::Dragging; }
    bool moved() const { return moved_; }
    const std::optional<std::string>& hovered_node() const { return hovered_node_; }
    const std::optional<std::string>& hovered_edge() const { return hovered_edge_; }

private:
    std::optional<std::string> pick(const Picker& picker, const graph_layout::Point& screen) const;
    void set_hover(std::optional<std::string> node_id, std::optional<std::string> edge_id);

    Viewport& viewport_;
    Picker pick_node_;
    Picker pick_edge_;
    SelectCallback on_select_;
    HoverCallback on_hover_;
    PointerState state_ = PointerState::Idle;
    graph_layout::Point start_;
    graph_layout::Point last_;
    bool moved_ = false;
    std::optional<std::string> hovered_node_;
    std::optional<std::string> hovered_edge_;
};

} // namespace canvas
