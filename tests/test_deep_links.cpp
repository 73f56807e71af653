#include <graph_util/deep_links.hpp>
#include <gtest/gtest.h>

using graph_util::DeepLinkKind;
using graph_util::extract_deep_links;

TEST(DeepLinks, GroupsByKindInOrder) {
    const std::map<std::string, std::string> props = {
        {"jira_url", "https://jira.example.com/browse/ENG-1"},
        {"slack_permalink", "https://example.slack.com/archives/C1/p1"},
        {"github_url", "https://github.com/acme/payments/pull/42"},
        {"url", "https://acme.example.com/page"},
        {"doc_url", "https://docs.example.com/runbook"},
        {"owner", "payments-team"},
    };
    const auto links = extract_deep_links(props);
    ASSERT_EQ(links.size(), 5u);
    EXPECT_EQ(links[0].kind, DeepLinkKind::External);
    EXPECT_EQ(links[0].label, "Open link");
    EXPECT_EQ(links[1].kind, DeepLinkKind::SourceControl);
    EXPECT_EQ(links[1].key, "github_url");
    EXPECT_EQ(links[2].kind, DeepLinkKind::Document);
    EXPECT_EQ(links[3].kind, DeepLinkKind::ChatThread);
    EXPECT_EQ(links[4].kind, DeepLinkKind::Tracker);
    EXPECT_EQ(links[4].url, "https://jira.example.com/browse/ENG-1");
}

TEST(DeepLinks, OnlyHttpUrls) {
    const std::map<std::string, std::string> props = {
        {"url", "javascript:alert(1)"},
        {"repo_url", "git@github.com:acme/payments.git"},
        {"permalink", "http://chat.example.com/t/9"},
    };
    const auto links = extract_deep_links(props);
    ASSERT_EQ(links.size(), 1u);
    EXPECT_EQ(links[0].kind, DeepLinkKind::ChatThread);
}

TEST(DeepLinks, DuplicateUrlsCollapse) {
    const std::map<std::string, std::string> props = {
        {"html_url", "https://github.com/acme/payments/pull/42"},
        {"pr_url", "https://github.com/acme/payments/pull/42"},
    };
    const auto links = extract_deep_links(props);
    ASSERT_EQ(links.size(), 1u);
    EXPECT_EQ(links[0].key, "html_url");
}

TEST(DeepLinks, NoLinks) {
    EXPECT_TRUE(extract_deep_links({}).empty());
    EXPECT_TRUE(extract_deep_links({{"title", "https://not-a-link-key.example.com"}}).empty());
}
