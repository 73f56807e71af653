#pragma once

#include <graph_layout/types.hpp>
#include <graph_model/graph_index.hpp>
#include <graph_render/scene.hpp>
#include <snapshot_diff/snapshot_diff.hpp>
#include <functional>
#include <optional>
#include <string>

namespace graph_render {

// Width of text at the given font size, in the same units as font_size.
using TextMeasure = std::function<float(const std::string& text, float font_size)>;

struct SceneInput {
    const graph_model::GraphIndex* graph = nullptr;
    const graph_layout::LayoutMap* layout = nullptr;
    const snapshot_diff::HighlightSet* highlight = nullptr;
    std::optional<std::string> selected_node;
    std::optional<std::string> hovered_node;
    std::optional<std::string> hovered_edge;
    std::optional<std::string> label_filter;
};

float node_radius(std::size_t degree);

// Resolves styles, dimming, rings, titles and tooltips. Pure: reads its input only.
Scene build_scene(const SceneInput& input, const TextMeasure& measure);

} // namespace graph_render
