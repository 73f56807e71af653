#include <explorer/explorer_config.hpp>
#include <gtest/gtest.h>

using explorer::ExplorerConfig;
using explorer::load_explorer_config_from_json;

TEST(ExplorerConfig, EmptyObjectGivesDefaults) {
    const auto c = load_explorer_config_from_json("{}");
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->endpoint_path, "/api/brain/universe");
    EXPECT_EQ(c->mode, graph_client::GraphMode::Universe);
    EXPECT_EQ(c->limit, 600);
    EXPECT_EQ(c->depth, 2);
    EXPECT_EQ(c->layout, graph_layout::LayoutStrategy::Radial);
    EXPECT_FALSE(c->modalities.has_value());
    EXPECT_EQ(c->timeout_seconds, 30);
    EXPECT_TRUE(explorer::time_controls_enabled(*c));
}

TEST(ExplorerConfig, ReadsAllKeys) {
    const char* text = R"({
        "title": "Graph", "api_base": "http://h:1", "endpoint_path": "/g", "mode": "issue",
        "depth": 3, "project_id": "p", "root_node_id": "issue:1", "limit": 90,
        "modalities": ["doc"], "snapshot_at": "2024-06-01T00:00:00Z", "layout": "column",
        "lock_viewport": true, "timeout_seconds": 5, "log_level": "debug",
        "offline": true, "snapshot_file": "s.json", "diagnostics": true,
        "radial_layout": {"center_labels": ["Service"], "center_modalities": []},
        "column_layout": {"order": ["issue", "doc"], "aliases": {"ticket": "issue"}, "fallback": "misc"},
        "unknown_key": 1
    })";
    std::string error;
    const auto c = load_explorer_config_from_json(text, &error);
    ASSERT_TRUE(c.has_value()) << error;
    EXPECT_EQ(c->title, "Graph");
    EXPECT_EQ(c->api_base, "http://h:1");
    EXPECT_EQ(c->mode, graph_client::GraphMode::Issue);
    EXPECT_EQ(c->root_node_id.value_or(""), "issue:1");
    EXPECT_EQ(c->modalities, (std::vector<std::string>{"doc"}));
    EXPECT_EQ(c->layout, graph_layout::LayoutStrategy::Column);
    EXPECT_TRUE(c->lock_viewport);
    EXPECT_TRUE(c->offline);
    EXPECT_TRUE(c->show_diagnostics);
    EXPECT_EQ(c->layout_config.radial.center_labels, (std::vector<std::string>{"Service"}));
    EXPECT_TRUE(c->layout_config.radial.center_modalities.empty());
    EXPECT_EQ(c->layout_config.column.aliases.at("ticket"), "issue");
    EXPECT_EQ(c->layout_config.column.fallback, "misc");
    EXPECT_FALSE(explorer::time_controls_enabled(*c));
}

TEST(ExplorerConfig, TimeControlsDefaultFollowsModeAndLock) {
    ExplorerConfig c;
    c.mode = graph_client::GraphMode::Issue;
    EXPECT_FALSE(explorer::time_controls_enabled(c));
    c.enable_time_controls = true;
    EXPECT_TRUE(explorer::time_controls_enabled(c));
    c = ExplorerConfig{};
    c.lock_viewport = true;
    EXPECT_FALSE(explorer::time_controls_enabled(c));
}

TEST(ExplorerConfig, RejectsBadValues) {
    std::string error;
    EXPECT_FALSE(load_explorer_config_from_json(R"({"mode": "galaxy"})", &error).has_value());
    EXPECT_EQ(error, "unknown mode 'galaxy'");
    EXPECT_FALSE(load_explorer_config_from_json(R"({"layout": "force"})", &error).has_value());
    EXPECT_EQ(error, "unknown layout 'force'");
    EXPECT_FALSE(load_explorer_config_from_json(R"({"timeout_seconds": 0})", &error).has_value());
    EXPECT_EQ(error, "timeout_seconds must be positive");
    EXPECT_FALSE(load_explorer_config_from_json("[]", &error).has_value());
    EXPECT_EQ(error, "config root must be an object");
}

TEST(ExplorerConfig, RejectsWrongTypes) {
    std::string error;
    EXPECT_FALSE(load_explorer_config_from_json(R"({"limit": "many"})", &error).has_value());
    EXPECT_FALSE(error.empty());
    EXPECT_FALSE(load_explorer_config_from_json(R"({"modalities": "doc"})").has_value());
    EXPECT_FALSE(load_explorer_config_from_json("{not json").has_value());
}

TEST(ExplorerConfig, NullKeepsDefault) {
    const auto c = load_explorer_config_from_json(R"({"limit": null, "project_id": null})");
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->limit, 600);
    EXPECT_FALSE(c->project_id.has_value());
}

TEST(ExplorerConfig, BundledConfigLoads) {
    std::string error;
    const auto c = explorer::load_explorer_config_from_json_file(
        std::string(GRAPH_EXPLORER_TEST_DATA_DIR) + "/explorer.json", &error);
    ASSERT_TRUE(c.has_value()) << error;
    EXPECT_EQ(c->title, "Payments knowledge graph");
}

TEST(ParseIntOption, AcceptsPlainIntegers) {
    EXPECT_EQ(explorer::parse_int_option("600").value_or(-1), 600);
    EXPECT_EQ(explorer::parse_int_option("-5").value_or(0), -5);
    EXPECT_EQ(explorer::parse_int_option("0").value_or(-1), 0);
}

TEST(ParseIntOption, RejectsEmptyAndNonNumeric) {
    EXPECT_FALSE(explorer::parse_int_option("").has_value());
    EXPECT_FALSE(explorer::parse_int_option("abc").has_value());
    EXPECT_FALSE(explorer::parse_int_option("12abc").has_value());
    EXPECT_FALSE(explorer::parse_int_option("99999999999999999999").has_value());
}
