#pragma once

#include <graph_layout/layout.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace graph_layout {

// Keeps the last layout and recomputes only when the node-id set or the
// strategy changes. version() increments on every recomputation.
class LayoutCache {
public:
    explicit LayoutCache(LayoutConfig config = {});

    // Returns true when the layout was recomputed.
    bool update(const std::vector<graph_model::GraphNode>& nodes, LayoutStrategy strategy);
    void clear();

    const LayoutMap& layout() const { return layout_; }
    std::uint64_t version() const { return version_; }
    LayoutStrategy strategy() const { return strategy_; }

    const LayoutConfig& config() const { return config_; }
    // Forces a recompute on the next update().
    void set_config(LayoutConfig config);

private:
    LayoutConfig config_;
    LayoutMap layout_;
    std::vector<std::string> ids_;
    LayoutStrategy strategy_ = LayoutStrategy::Radial;
    bool valid_ = false;
    std::uint64_t version_ = 0;
};

} // namespace graph_layout
