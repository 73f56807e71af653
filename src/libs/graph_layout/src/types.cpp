#include <graph_layout/types.hpp>
#include <algorithm>

namespace graph_layout {

Bounds compute_bounds(const std::vector<Point>& points) {
    Bounds b;
    if (points.empty()) return b;
    b.min_x = b.max_x = points.front().x;
    b.min_y = b.max_y = points.front().y;
    for (const auto& p : points) {
        b.min_x = std::min(b.min_x, p.x);
        b.min_y = std::min(b.min_y, p.y);
        b.max_x = std::max(b.max_x, p.x);
        b.max_y = std::max(b.max_y, p.y);
    }
    return b;
}

const char* layout_strategy_name(LayoutStrategy strategy) {
    return strategy == LayoutStrategy::Column ? "column" : "radial";
}

bool parse_layout_strategy(const std::string& name, LayoutStrategy& out) {
    if (name == "radial") {
        out = LayoutStrategy::Radial;
        return true;
    }
    if (name == "column" || name == "neo4j") {
        out = LayoutStrategy::Column;
        return true;
    }
    return false;
}

} // namespace graph_layout
