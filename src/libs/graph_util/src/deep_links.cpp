#include <graph_util/deep_links.hpp>
#include <unordered_set>

namespace graph_util {

namespace {

struct KeyRule {
    DeepLinkKind kind;
    const char* key;
};

const KeyRule key_rules[] = {
    {DeepLinkKind::External, "url"},
    {DeepLinkKind::External, "html_url"},
    {DeepLinkKind::External, "canonical_url"},
    {DeepLinkKind::SourceControl, "github_url"},
    {DeepLinkKind::SourceControl, "repo_url"},
    {DeepLinkKind::SourceControl, "pr_url"},
    {DeepLinkKind::SourceControl, "commit_url"},
    {DeepLinkKind::Document, "doc_url"},
    {DeepLinkKind::Document, "docs_url"},
    {DeepLinkKind::ChatThread, "slack_permalink"},
    {DeepLinkKind::ChatThread, "permalink"},
    {DeepLinkKind::ChatThread, "thread_url"},
    {DeepLinkKind::Tracker, "issue_url"},
    {DeepLinkKind::Tracker, "ticket_url"},
    {DeepLinkKind::Tracker, "linear_url"},
    {DeepLinkKind::Tracker, "jira_url"},
};

const char* link_label(DeepLinkKind kind) {
    switch (kind) {
    case DeepLinkKind::External: return "Open link";
    case DeepLinkKind::SourceControl: return "Open in source control";
    case DeepLinkKind::Document: return "Open document";
    case DeepLinkKind::ChatThread: return "Open chat thread";
    case DeepLinkKind::Tracker: return "Open ticket";
    }
    return "Open link";
}

bool is_http_url(const std::string& value) {
    return value.rfind("http://", 0) == 0 || value.rfind("https://", 0) == 0;
}

} // namespace

const char* deep_link_kind_name(DeepLinkKind kind) {
    switch (kind) {
    case DeepLinkKind::External: return "external";
    case DeepLinkKind::SourceControl: return "source_control";
    case DeepLinkKind::Document: return "document";
    case DeepLinkKind::ChatThread: return "chat_thread";
    case DeepLinkKind::Tracker: return "tracker";
    }
    return "external";
}

std::vector<DeepLink> extract_deep_links(const std::map<std::string, std::string>& props) {
    // key_rules is grouped by kind already; walk kinds in declaration order.
    std::vector<DeepLink> links;
    std::unordered_set<std::string> seen_urls;
    for (const auto& rule : key_rules) {
        auto it = props.find(rule.key);
        if (it == props.end() || !is_http_url(it->second)) continue;
        if (!seen_urls.insert(it->second).second) continue;
        DeepLink link;
        link.kind = rule.kind;
        link.key = rule.key;
        link.label = link_label(rule.kind);
        link.url = it->second;
        links.push_back(std::move(link));
    }
    return links;
}

} // namespace graph_util
