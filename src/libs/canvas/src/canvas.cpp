#include <canvas/canvas.hpp>
#include <canvas/hit_test.hpp>

namespace canvas {

GraphCanvas::GraphCanvas()
    : pointer_(viewport_)
{
    pointer_.set_node_picker([this](const graph_layout::Point& world) {
        return pick_node(animator_.current(), world);
    });
    pointer_.set_edge_picker([this](const graph_layout::Point& world) -> std::optional<std::string> {
        if (!graph_) return std::nullopt;
        return pick_edge(animator_.current(), graph_->edges(), world);
    });
    pointer_.set_on_hover([this](const std::optional<std::string>& node_id, const std::optional<std::string>& edge_id) {
        selection_.set_hover(node_id, edge_id);
        if (on_hover_) on_hover_(node_id);
    });
    pointer_.set_on_select([this](const std::optional<std::string>& node_id) {
        selection_.select(node_id);
        if (on_select_) on_select_(node_id);
    });
    selection_.changed().subscribe([this]() { scene_dirty_ = true; });
}

GraphCanvas::~GraphCanvas() = default;

void GraphCanvas::set_graph(const graph_model::GraphIndex* graph) {
    graph_ = graph;
    pointer_.clear_hover();
    if (graph_) {
        selection_.set_hover(std::nullopt, std::nullopt);
        selection_.prune(*graph_);
    } else {
        selection_.clear();
    }
    scene_dirty_ = true;
}

void GraphCanvas::set_layout(const graph_layout::LayoutMap* layout, std::uint64_t version) {
    if (layout_seen_ && layout == layout_ && version == layout_version_) return;
    const bool had_nodes = layout_ && !layout_->empty();
    layout_ = layout;
    layout_version_ = version;
    layout_seen_ = true;
    if (layout_) {
        animator_.set_targets(*layout_);
        if (!had_nodes) animator_.snap_to_targets();
    } else {
        animator_.set_targets({});
        animator_.snap_to_targets();
    }
    // Layout changes refit even when locked.
    pending_fit_ = true;
    scene_dirty_ = true;
}

void GraphCanvas::set_highlight(const snapshot_diff::HighlightSet* highlight) {
    highlight_ = highlight;
    scene_dirty_ = true;
}

void GraphCanvas::set_label_filter(std::optional<std::string> label) {
    if (label == label_filter_) return;
    label_filter_ = std::move(label);
    scene_dirty_ = true;
}

void GraphCanvas::set_focus_nodes(std::vector<std::string> ids) {
    if (ids == focus_ids_) return;
    focus_ids_ = std::move(ids);
    if (!viewport_.locked()) pending_fit_ = true;
}

void GraphCanvas::set_locked(bool locked) {
    viewport_.set_locked(locked);
}

void GraphCanvas::focus_nodes(const std::vector<std::string>& ids) {
    if (!layout_) {
        viewport_.reset();
        return;
    }
    viewport_.focus_nodes(*layout_, ids);
}

void GraphCanvas::reset_view() {
    focus_nodes();
}

void GraphCanvas::refit() {
    focus_nodes(focus_ids_);
}

} // namespace canvas
