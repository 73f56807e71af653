#pragma once

#include <graph_model/graph_index.hpp>
#include <graph_util/change_notifier.hpp>
#include <optional>
#include <string>

namespace canvas {

// Selected node plus hovered node/edge. Publishes on every change.
class SelectionState {
public:
    bool select(std::optional<std::string> node_id);
    bool set_hover(std::optional<std::string> node_id, std::optional<std::string> edge_id);
    void clear();

    // Drops ids that no longer exist in the graph.
    bool prune(const graph_model::GraphIndex& graph);

    const std::optional<std::string>& selected() const { return selected_; }
    const std::optional<std::string>& hovered_node() const { return hovered_node_; }
    const std::optional<std::string>& hovered_edge() const { return hovered_edge_; }
    // Hovered node, else selected node.
    const std::optional<std::string>& anchor() const { return hovered_node_ ? hovered_node_ : selected_; }

    graph_util::ChangeNotifier<>& changed() { return changed_; }

private:
    std::optional<std::string> selected_;
    std::optional<std::string> hovered_node_;
    std::optional<std::string> hovered_edge_;
    graph_util::ChangeNotifier<> changed_;
};

} // namespace canvas
