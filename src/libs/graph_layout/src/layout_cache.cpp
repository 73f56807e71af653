#include <graph_layout/layout_cache.hpp>
#include <graph_util/log.hpp>
#include <algorithm>
#include <utility>

namespace graph_layout {

LayoutCache::LayoutCache(LayoutConfig config)
    : config_(std::move(config))
{
}

bool LayoutCache::update(const std::vector<graph_model::GraphNode>& nodes, LayoutStrategy strategy) {
    std::vector<std::string> ids;
    ids.reserve(nodes.size());
    for (const auto& n : nodes) ids.push_back(n.id);
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());

    if (valid_ && strategy == strategy_ && ids == ids_) return false;

    layout_ = compute_layout(nodes, strategy, config_);
    ids_ = std::move(ids);
    strategy_ = strategy;
    valid_ = true;
    ++version_;
    graph_util::logger()->debug("Layout recomputed: strategy={} nodes={} version={}",
        layout_strategy_name(strategy), layout_.size(), version_);
    return true;
}

void LayoutCache::clear() {
    if (!valid_ && layout_.empty()) return;
    layout_.clear();
    ids_.clear();
    valid_ = false;
    ++version_;
}

void LayoutCache::set_config(LayoutConfig config) {
    config_ = std::move(config);
    valid_ = false;
}

} // namespace graph_layout
