#include <canvas/hit_test.hpp>
#include <gtest/gtest.h>
#include "graph_fixtures.hpp"

using graph_layout::LayoutMap;

namespace {

const LayoutMap layout = {
    {"a", {0.0, 0.0}},
    {"b", {100.0, 0.0}},
    {"c", {0.0, 100.0}},
};

} // namespace

TEST(PickNode, CenterAlwaysPicksThatNode) {
    for (const auto& [id, p] : layout) {
        const auto picked = canvas::pick_node(layout, p);
        ASSERT_TRUE(picked.has_value());
        EXPECT_EQ(*picked, id);
    }
}

TEST(PickNode, FarAwayPicksNothing) {
    EXPECT_FALSE(canvas::pick_node(layout, {-100.0, -100.0}).has_value());
    EXPECT_FALSE(canvas::pick_node(layout, {200.0, 0.0}).has_value());
}

TEST(PickNode, ThresholdIsStrict) {
    EXPECT_TRUE(canvas::pick_node(layout, {17.9, 0.0}).has_value());
    EXPECT_FALSE(canvas::pick_node(layout, {18.0, 0.0}).has_value());
}

TEST(PickNode, NearestWins) {
    const LayoutMap close = { {"left", {0.0, 0.0}}, {"right", {10.0, 0.0}} };
    EXPECT_EQ(canvas::pick_node(close, {7.0, 0.0}).value_or(""), "right");
    EXPECT_EQ(canvas::pick_node(close, {5.0, 0.0}).value_or(""), "left");
}

TEST(PickEdge, PicksSegmentWithinThreshold) {
    const auto ab = graph_test::edge("a", "b", "DOCUMENTS", "ab");
    const auto ac = graph_test::edge("a", "c", "OWNS", "ac");
    const std::vector<const graph_model::GraphEdge*> edges = { &ab, &ac };
    EXPECT_EQ(canvas::pick_edge(layout, edges, {50.0, 10.0}).value_or(""), "ab");
    EXPECT_EQ(canvas::pick_edge(layout, edges, {8.0, 60.0}).value_or(""), "ac");
    EXPECT_FALSE(canvas::pick_edge(layout, edges, {50.0, 50.0}).has_value());
}

TEST(PickEdge, SkipsZeroLengthAndUnplacedEdges) {
    const auto loop = graph_test::edge("a", "a", "SELF", "loop");
    const auto dangling = graph_test::edge("a", "zzz", "X", "dangling");
    const std::vector<const graph_model::GraphEdge*> edges = { &loop, &dangling };
    EXPECT_FALSE(canvas::pick_edge(layout, edges, {0.0, 0.0}).has_value());
}

TEST(DistanceToSegment, ClampsToEndpoints) {
    EXPECT_DOUBLE_EQ(canvas::distance_to_segment({5, 3}, {0, 0}, {10, 0}), 3.0);
    EXPECT_DOUBLE_EQ(canvas::distance_to_segment({-3, 4}, {0, 0}, {10, 0}), 5.0);
    EXPECT_DOUBLE_EQ(canvas::distance_to_segment({13, 4}, {0, 0}, {10, 0}), 5.0);
}
