#include <graph_model/graph_index.hpp>
#include <gtest/gtest.h>
#include "graph_fixtures.hpp"

using graph_model::GraphIndex;
using graph_test::edge;
using graph_test::node;
using graph_test::snapshot;

TEST(GraphIndex, IndexesNodesAndEdges) {
    GraphIndex index(snapshot({node("a"), node("b"), node("c")},
        {edge("a", "b", "OWNS"), edge("b", "c", "MENTIONS"), edge("a", "a", "SELF")}));
    EXPECT_FALSE(index.empty());
    EXPECT_EQ(index.nodes().size(), 3u);
    EXPECT_EQ(index.edges().size(), 3u);
    EXPECT_EQ(index.find_node("b")->id, "b");
    EXPECT_EQ(index.find_edge("a->b")->type, "OWNS");
    EXPECT_EQ(index.find_node("zzz"), nullptr);

    EXPECT_EQ(index.degree("b"), 2u);
    EXPECT_EQ(index.neighbors("a"), (std::unordered_set<std::string>{"b"}));
    EXPECT_EQ(index.incident_edges("a").size(), 2u);
    EXPECT_TRUE(index.neighbors("unknown").empty());
}

TEST(GraphIndex, DropsDanglingAndDuplicateEdges) {
    GraphIndex index(snapshot({node("a"), node("b")},
        {edge("a", "b"), edge("a", "ghost"), edge("b", "a", "OWNS", "a->b")}));
    EXPECT_EQ(index.edges().size(), 1u);
    EXPECT_EQ(index.dropped_edge_count(), 2u);
    EXPECT_FALSE(index.contains_node("ghost"));
}

TEST(GraphIndex, FirstNodeWinsOnDuplicateId) {
    GraphIndex index(snapshot({node("a", "Doc"), node("a", "Issue")}));
    EXPECT_EQ(index.nodes().size(), 1u);
    EXPECT_EQ(index.find_node("a")->label, "Doc");
}

TEST(GraphIndex, EmptyIndex) {
    GraphIndex index;
    EXPECT_TRUE(index.empty());
    EXPECT_EQ(index.snapshot(), nullptr);
    EXPECT_EQ(index.degree("a"), 0u);
}

TEST(SnapshotMeta, ComputedFromNodes) {
    auto a = node("a", "Doc", "doc");
    a.created_at = "2024-06-01T10:00:00Z";
    a.props = {{"owner", "x"}, {"url", "https://e.example.com"}};
    auto b = node("b", "Doc", "doc");
    b.created_at = "2024-06-03T10:00:00Z";
    auto c = node("c", "Issue");
    const auto s = snapshot({a, b, c}, {edge("a", "b"), edge("b", "c", "")});
    const auto& meta = s->meta;
    EXPECT_EQ(meta.node_label_counts.at("Doc"), 2);
    EXPECT_EQ(meta.modality_counts.at("doc"), 2);
    EXPECT_EQ(meta.modality_counts.count("Issue"), 0u);
    EXPECT_EQ(meta.rel_type_counts.at("RELATED"), 2);
    EXPECT_EQ(meta.property_keys, (std::vector<std::string>{"owner", "url"}));
    EXPECT_EQ(meta.missing_timestamp_labels, (std::vector<std::string>{"Issue"}));
    EXPECT_EQ(meta.min_timestamp.value_or(""), "2024-06-01T10:00:00.000Z");
    EXPECT_EQ(meta.max_timestamp.value_or(""), "2024-06-03T10:00:00.000Z");
}
