#include <graph_render/edge_styles.hpp>
#include <graph_render/scene_builder.hpp>
#include <gtest/gtest.h>
#include <cmath>
#include <stdexcept>
#include "graph_fixtures.hpp"

using graph_render::SceneInput;
using graph_test::edge;
using graph_test::node;

namespace {

// Fixed-width glyphs: half the font size per character.
float measure(const std::string& text, float font_size) {
    return static_cast<float>(text.size()) * font_size * 0.5f;
}

struct SceneHarness {
    graph_model::GraphIndex graph{graph_test::snapshot(
        {node("hub", "Component", "component", "Payments"), node("doc", "Doc", "doc", "Runbook"),
         node("ticket", "Issue", "issue", "ENG-1"), node("far", "Doc", "doc", "Far away")},
        {edge("hub", "doc", "DOCUMENTS"), edge("ticket", "hub", "AFFECTS"), edge("doc", "far", "LINKS")})};
    graph_layout::LayoutMap layout = {
        {"hub", {0.0, 0.0}}, {"doc", {100.0, 0.0}}, {"ticket", {0.0, 100.0}}, {"far", {200.0, 0.0}},
    };
    snapshot_diff::HighlightSet highlight;

    SceneInput input() {
        SceneInput in;
        in.graph = &graph;
        in.layout = &layout;
        in.highlight = &highlight;
        return in;
    }
};

const graph_render::SceneNode& find_node(const graph_render::Scene& scene, const std::string& id) {
    for (const auto& n : scene.nodes) {
        if (n.id == id) return n;
    }
    throw std::runtime_error("node not in scene: " + id);
}

const graph_render::SceneEdge& find_edge(const graph_render::Scene& scene, const std::string& id) {
    for (const auto& e : scene.edges) {
        if (e.id == id) return e;
    }
    throw std::runtime_error("edge not in scene: " + id);
}

} // namespace

TEST(NodeRadius, GrowsWithDegreeUpToBonus) {
    EXPECT_FLOAT_EQ(graph_render::node_radius(0), 7.0f);
    EXPECT_FLOAT_EQ(graph_render::node_radius(4), 9.0f);
    EXPECT_FLOAT_EQ(graph_render::node_radius(100), 11.0f);
}

TEST(SceneBuilder, EmptyWithoutInput) {
    EXPECT_TRUE(graph_render::build_scene(SceneInput{}, measure).empty());
}

TEST(SceneBuilder, PlainSceneHasNoDimmingOrTooltips) {
    SceneHarness h;
    const auto scene = graph_render::build_scene(h.input(), measure);
    EXPECT_EQ(scene.nodes.size(), 4u);
    EXPECT_EQ(scene.edges.size(), 3u);
    EXPECT_TRUE(scene.tooltips.empty());
    for (const auto& n : scene.nodes) {
        EXPECT_FALSE(n.dimmed);
        EXPECT_TRUE(n.rings.empty());
        EXPECT_FALSE(n.title.has_value());
    }
    EXPECT_FLOAT_EQ(find_node(scene, "hub").radius, 7.0f + std::sqrt(2.0f));
}

TEST(SceneBuilder, SelectionDimsNonNeighbors) {
    SceneHarness h;
    auto in = h.input();
    in.selected_node = "hub";
    const auto scene = graph_render::build_scene(in, measure);
    EXPECT_FALSE(find_node(scene, "hub").dimmed);
    EXPECT_FALSE(find_node(scene, "doc").dimmed);
    EXPECT_FALSE(find_node(scene, "ticket").dimmed);
    EXPECT_TRUE(find_node(scene, "far").dimmed);

    const auto& hub = find_node(scene, "hub");
    ASSERT_EQ(hub.rings.size(), 1u);
    EXPECT_EQ(hub.rings[0].color, graph_render::palette::selected_ring);
    EXPECT_EQ(hub.title.value_or(""), "Payments");

    EXPECT_EQ(find_edge(scene, "hub->doc").color, graph_render::palette::anchor_edge);
    // Touches a neighbor of the anchor.
    EXPECT_EQ(find_edge(scene, "doc->far").color, graph_render::palette::anchor_edge);
}

TEST(SceneBuilder, HoverTakesPrecedenceOverSelection) {
    SceneHarness h;
    auto in = h.input();
    in.selected_node = "hub";
    in.hovered_node = "far";
    const auto scene = graph_render::build_scene(in, measure);
    EXPECT_TRUE(find_node(scene, "hub").dimmed);
    EXPECT_FALSE(find_node(scene, "doc").dimmed);
    EXPECT_FALSE(find_node(scene, "far").dimmed);
    ASSERT_EQ(scene.tooltips.size(), 1u);
    EXPECT_EQ(scene.tooltips[0].lines, (std::vector<std::string>{"LINKS -> Runbook"}));
}

TEST(SceneBuilder, AnchorTooltipSitsRightOfNode) {
    SceneHarness h;
    auto in = h.input();
    in.selected_node = "hub";
    const auto scene = graph_render::build_scene(in, measure);
    ASSERT_EQ(scene.tooltips.size(), 1u);
    const auto& tip = scene.tooltips[0];
    EXPECT_EQ(tip.lines, (std::vector<std::string>{"DOCUMENTS -> Runbook", "AFFECTS -> ENG-1"}));
    EXPECT_FLOAT_EQ(tip.height, 2 * 12.0f + 2 * 6.0f);
    EXPECT_FLOAT_EQ(tip.width, 20 * 5.0f + 2 * 8.0f);
    EXPECT_DOUBLE_EQ(tip.origin.x, 18.0);
    EXPECT_DOUBLE_EQ(tip.origin.y, -tip.height);
}

TEST(SceneBuilder, LabelFilterDims) {
    SceneHarness h;
    auto in = h.input();
    in.label_filter = "Doc";
    const auto scene = graph_render::build_scene(in, measure);
    EXPECT_TRUE(find_node(scene, "hub").dimmed);
    EXPECT_FALSE(find_node(scene, "doc").dimmed);
    EXPECT_FALSE(find_node(scene, "far").dimmed);
}

TEST(SceneBuilder, HoveredEdgeGetsTooltip) {
    SceneHarness h;
    auto in = h.input();
    in.hovered_edge = "hub->doc";
    const auto scene = graph_render::build_scene(in, measure);
    EXPECT_EQ(find_edge(scene, "hub->doc").color, graph_render::palette::hovered_edge);
    ASSERT_EQ(scene.tooltips.size(), 1u);
    EXPECT_EQ(scene.tooltips[0].lines, (std::vector<std::string>{"Payments", "DOCUMENTS -> Runbook"}));
    EXPECT_DOUBLE_EQ(scene.tooltips[0].origin.x, 50.0 + 12.0);
}

TEST(SceneBuilder, RecentItemsAreMarked) {
    SceneHarness h;
    h.highlight.nodes = {"far"};
    h.highlight.edges = {"doc->far"};
    auto in = h.input();
    in.hovered_node = "far";
    const auto scene = graph_render::build_scene(in, measure);
    const auto& far = find_node(scene, "far");
    ASSERT_EQ(far.rings.size(), 2u);
    EXPECT_TRUE(far.rings[0].recent);
    EXPECT_EQ(far.rings[1].color, graph_render::palette::hovered_ring);
    const auto& e = find_edge(scene, "doc->far");
    EXPECT_TRUE(e.recent);
    EXPECT_EQ(e.color, graph_render::palette::recent_edge);
    EXPECT_EQ(e.base_color, graph_render::palette::anchor_edge);
}

TEST(SceneBuilder, UnplacedNodesAreSkipped) {
    SceneHarness h;
    h.layout.erase("far");
    const auto scene = graph_render::build_scene(h.input(), measure);
    EXPECT_EQ(scene.nodes.size(), 3u);
    EXPECT_EQ(scene.edges.size(), 2u);
}
