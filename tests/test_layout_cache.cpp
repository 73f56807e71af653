#include <graph_layout/layout_cache.hpp>
#include <gtest/gtest.h>
#include "graph_fixtures.hpp"

using graph_layout::LayoutCache;
using graph_layout::LayoutStrategy;
using graph_test::node;

TEST(LayoutCache, RecomputesOnlyWhenIdSetChanges) {
    LayoutCache cache;
    std::vector<graph_model::GraphNode> nodes = { node("a", "Component", "component"), node("b", "Doc", "doc") };
    EXPECT_TRUE(cache.update(nodes, LayoutStrategy::Radial));
    EXPECT_EQ(cache.version(), 1u);
    EXPECT_EQ(cache.layout().size(), 2u);

    // Same ids, different order and payload.
    std::vector<graph_model::GraphNode> reordered = { node("b", "Doc", "doc", "renamed"), node("a", "Component", "component") };
    EXPECT_FALSE(cache.update(reordered, LayoutStrategy::Radial));
    EXPECT_EQ(cache.version(), 1u);

    nodes.push_back(node("c", "Doc", "doc"));
    EXPECT_TRUE(cache.update(nodes, LayoutStrategy::Radial));
    EXPECT_EQ(cache.version(), 2u);
    EXPECT_EQ(cache.layout().count("c"), 1u);
}

TEST(LayoutCache, StrategyChangeRecomputes) {
    LayoutCache cache;
    const std::vector<graph_model::GraphNode> nodes = { node("a", "Issue", "issue"), node("b", "Doc", "doc") };
    cache.update(nodes, LayoutStrategy::Radial);
    EXPECT_TRUE(cache.update(nodes, LayoutStrategy::Column));
    EXPECT_EQ(cache.strategy(), LayoutStrategy::Column);
    EXPECT_EQ(cache.version(), 2u);
}

TEST(LayoutCache, ClearAndConfigForceRecompute) {
    LayoutCache cache;
    const std::vector<graph_model::GraphNode> nodes = { node("a") };
    cache.update(nodes, LayoutStrategy::Radial);
    cache.clear();
    EXPECT_TRUE(cache.layout().empty());
    EXPECT_EQ(cache.version(), 2u);
    cache.clear();
    EXPECT_EQ(cache.version(), 2u);

    EXPECT_TRUE(cache.update(nodes, LayoutStrategy::Radial));
    cache.set_config(cache.config());
    EXPECT_TRUE(cache.update(nodes, LayoutStrategy::Radial));
}
