#pragma once

#include <map>
#include <string>
#include <vector>

namespace graph_layout {

namespace spacing {

constexpr double center_ring_radius = 40.0;
constexpr double first_ring_radius = 140.0;
constexpr double ring_step = 90.0;
constexpr double fallback_ring_radius = 120.0;
constexpr double ring_jitter = 0.08;

constexpr double column_spacing = 120.0;
constexpr double row_spacing = 70.0;
constexpr double column_jitter_spread = 14.0;

} // namespace spacing

// Nodes whose label or modality appears here sit in the center ring.
struct RadialLayoutConfig {
    std::vector<std::string> center_labels = {"Component"};
    std::vector<std::string> center_modalities = {"component"};
};

// Column order and synonym table, matched on lowercase label/modality.
// Kinds that resolve to no column share the fallback column, placed after
// the known columns in lexicographic order.
struct ColumnLayoutConfig {
    std::vector<std::string> order = {
        "issue", "supportcase", "slackevent", "slackthread", "gitevent", "pr",
        "repository", "codeartifact", "source", "chunk", "transcriptchunk",
        "component", "service", "apiendpoint", "doc", "activitysignal",
        "impactevent", "channel", "playlist", "video",
    };
    std::map<std::string, std::string> aliases = {
        {"slack", "slackevent"},
        {"support", "supportcase"},
        {"git", "gitevent"},
        {"repo", "repository"},
        {"repositories", "repository"},
        {"api", "apiendpoint"},
        {"endpoint", "apiendpoint"},
        {"docs", "doc"},
        {"document", "doc"},
        {"documents", "doc"},
        {"component", "component"},
        {"components", "component"},
        {"service", "service"},
        {"services", "service"},
        {"transcript", "transcriptchunk"},
        {"transcription", "transcriptchunk"},
    };
    std::string fallback = "other";
};

struct LayoutConfig {
    RadialLayoutConfig radial;
    ColumnLayoutConfig column;
};

} // namespace graph_layout
