#pragma once

#include <graph_layout/layout_config.hpp>
#include <graph_layout/types.hpp>
#include <graph_model/types.hpp>
#include <string>
#include <vector>

namespace graph_layout {

// Pure and deterministic: identical node ids and strategy give identical maps.
LayoutMap compute_layout(const std::vector<graph_model::GraphNode>& nodes,
    LayoutStrategy strategy,
    const LayoutConfig& config = {});

LayoutMap radial_layout(const std::vector<graph_model::GraphNode>& nodes,
    const RadialLayoutConfig& config = {});

LayoutMap column_layout(const std::vector<graph_model::GraphNode>& nodes,
    const ColumnLayoutConfig& config = {});

// Column the node is stacked in (lowercase canonical kind or config.fallback).
std::string column_key(const graph_model::GraphNode& node, const ColumnLayoutConfig& config);

// Stable offset in [-spread/2, spread/2) derived from the key's bytes.
double deterministic_jitter(const std::string& key, double spread);

} // namespace graph_layout
