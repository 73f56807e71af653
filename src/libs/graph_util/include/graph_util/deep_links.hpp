#pragma once

#include <map>
#include <string>
#include <vector>

namespace graph_util {

enum class DeepLinkKind {
    External,
    SourceControl,
    Document,
    ChatThread,
    Tracker
};

struct DeepLink {
    DeepLinkKind kind = DeepLinkKind::External;
    std::string key;    // property key the link was found under
    std::string label;  // e.g. "Open in source control"
    std::string url;
};

const char* deep_link_kind_name(DeepLinkKind kind);

// Picks link-like properties by key presence. Only http(s) values are returned,
// grouped by kind (External, SourceControl, Document, ChatThread, Tracker), one entry per URL.
std::vector<DeepLink> extract_deep_links(const std::map<std::string, std::string>& props);

} // namespace graph_util
