#pragma once

#include <animation/point_animator.hpp>
#include <canvas/pointer_tracker.hpp>
#include <canvas/selection_state.hpp>
#include <canvas/viewport.hpp>
#include <graph_layout/types.hpp>
#include <graph_model/graph_index.hpp>
#include <graph_render/scene.hpp>
#include <snapshot_diff/snapshot_diff.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

struct ImVec2;

namespace canvas {

// ImGui widget hosting one graph surface: input, camera, selection and drawing.
// Graph, layout and highlight are borrowed; the owner keeps them alive while set.
class GraphCanvas {
public:
    using SelectCallback = std::function<void(const std::optional<std::string>& node_id)>;
    using HoverCallback = std::function<void(const std::optional<std::string>& node_id)>;

    GraphCanvas();
    ~GraphCanvas();
    GraphCanvas(const GraphCanvas&) = delete;
    GraphCanvas& operator=(const GraphCanvas&) = delete;

    // Clears selection/hover that the new graph no longer contains.
    void set_graph(const graph_model::GraphIndex* graph);
    const graph_model::GraphIndex* graph() const { return graph_; }

    // A new version refits the view and animates nodes toward their new positions.
    void set_layout(const graph_layout::LayoutMap* layout, std::uint64_t version);
    void set_highlight(const snapshot_diff::HighlightSet* highlight);
    void set_highlight_fade(float fade) { highlight_fade_ = fade; }
    void set_label_filter(std::optional<std::string> label);
    const std::optional<std::string>& label_filter() const { return label_filter_; }

    // Auto-fit target; empty means all nodes.
    void set_focus_nodes(std::vector<std::string> ids);
    void set_locked(bool locked);
    bool locked() const { return viewport_.locked(); }

    void set_on_select(SelectCallback cb) { on_select_ = std::move(cb); }
    void set_on_hover(HoverCallback cb) { on_hover_ = std::move(cb); }

    void focus_nodes(const std::vector<std::string>& ids = {});
    void reset_view();
    void mark_scene_dirty() { scene_dirty_ = true; }

    Viewport& viewport() { return viewport_; }
    const Viewport& viewport() const { return viewport_; }
    SelectionState& selection() { return selection_; }
    const SelectionState& selection() const { return selection_; }
    const PointerTracker& pointer() const { return pointer_; }
    const graph_render::Scene& scene() const { return scene_; }

    // True while node positions are still easing.
    bool is_animating() const { return !animator_.settled(); }

    // Input, easing and drawing for one frame; defined in the canvas_widget library.
    bool update_and_draw(float region_width, float region_height, float dt);

private:
    void handle_input(const ImVec2& origin, float region_width, float region_height);
    void refit();
    void rebuild_scene();

    const graph_model::GraphIndex* graph_ = nullptr;
    const graph_layout::LayoutMap* layout_ = nullptr;
    const snapshot_diff::HighlightSet* highlight_ = nullptr;
    std::uint64_t layout_version_ = 0;
    bool layout_seen_ = false;
    float highlight_fade_ = 0.f;
    std::optional<std::string> label_filter_;
    std::vector<std::string> focus_ids_;

    Viewport viewport_;
    PointerTracker pointer_;
    SelectionState selection_;
    animation::PointAnimator animator_;
    graph_render::Scene scene_;
    bool scene_dirty_ = true;
    bool pending_fit_ = false;
    bool mouse_inside_ = false;

    SelectCallback on_select_;
    HoverCallback on_hover_;
};

} // namespace canvas
