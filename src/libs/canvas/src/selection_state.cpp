#include <canvas/selection_state.hpp>
#include <utility>

namespace canvas {

bool SelectionState::select(std::optional<std::string> node_id) {
    if (node_id == selected_) return false;
    selected_ = std::move(node_id);
    changed_.notify();
    return true;
}

bool SelectionState::set_hover(std::optional<std::string> node_id, std::optional<std::string> edge_id) {
    if (node_id == hovered_node_ && edge_id == hovered_edge_) return false;
    hovered_node_ = std::move(node_id);
    hovered_edge_ = std::move(edge_id);
    changed_.notify();
    return true;
}

void SelectionState::clear() {
    if (!selected_ && !hovered_node_ && !hovered_edge_) return;
    selected_.reset();
    hovered_node_.reset();
    hovered_edge_.reset();
    changed_.notify();
}

bool SelectionState::prune(const graph_model::GraphIndex& graph) {
    bool changed = false;
    if (selected_ && !graph.contains_node(*selected_)) {
        selected_.reset();
        changed = true;
    }
    if (hovered_node_ && !graph.contains_node(*hovered_node_)) {
        hovered_node_.reset();
        changed = true;
    }
    if (hovered_edge_ && !graph.find_edge(*hovered_edge_)) {
        hovered_edge_.reset();
        changed = true;
    }
    if (changed) changed_.notify();
    return changed;
}

} // namespace canvas
