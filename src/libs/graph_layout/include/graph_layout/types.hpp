#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace graph_layout {

struct Point {
    double x = 0;
    double y = 0;
};

// World-space position per node id.
using LayoutMap = std::unordered_map<std::string, Point>;

enum class LayoutStrategy { Radial, Column };

struct Bounds {
    double min_x = 0;
    double min_y = 0;
    double max_x = 0;
    double max_y = 0;
};

// Bounding box of the given points; all zeros for an empty list.
Bounds compute_bounds(const std::vector<Point>& points);

const char* layout_strategy_name(LayoutStrategy strategy);
// Accepts "radial" and "column" (also "neo4j" for the column layout).
bool parse_layout_strategy(const std::string& name, LayoutStrategy& out);

} // namespace graph_layout
