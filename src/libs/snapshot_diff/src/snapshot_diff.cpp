#include <snapshot_diff/snapshot_diff.hpp>
#include <graph_util/log.hpp>
#include <graph_util/time_format.hpp>
#include <utility>

namespace snapshot_diff {

HighlightSet diff_snapshots(const graph_model::Snapshot& previous, const graph_model::Snapshot& current) {
    std::unordered_set<std::string> prev_nodes;
    std::unordered_set<std::string> prev_edges;
    for (const auto& n : previous.nodes) prev_nodes.insert(n.id);
    for (const auto& e : previous.edges) prev_edges.insert(e.id);

    HighlightSet out;
    for (const auto& n : current.nodes) {
        if (!prev_nodes.count(n.id)) out.nodes.insert(n.id);
    }
    for (const auto& e : current.edges) {
        if (!prev_edges.count(e.id)) out.edges.insert(e.id);
    }
    return out;
}

bool HighlightTracker::on_snapshot(const graph_model::Snapshot& snapshot) {
    const auto generated_ms = graph_util::parse_iso8601_ms(snapshot.generated_at);
    if (generated_ms && last_generated_ms_ && *generated_ms < *last_generated_ms_) {
        graph_util::logger()->debug("Ignoring stale snapshot generatedAt={}", snapshot.generated_at);
        return false;
    }
    if (generated_ms) last_generated_ms_ = generated_ms;

    std::unordered_set<std::string> nodes;
    std::unordered_set<std::string> edges;
    for (const auto& n : snapshot.nodes) nodes.insert(n.id);
    for (const auto& e : snapshot.edges) edges.insert(e.id);

    if (has_baseline_) {
        HighlightSet next;
        for (const auto& id : nodes) {
            if (!node_ids_.count(id)) next.nodes.insert(id);
        }
        for (const auto& id : edges) {
            if (!edge_ids_.count(id)) next.edges.insert(id);
        }
        if (!next.empty())
            graph_util::logger()->debug("Snapshot diff: {} new nodes, {} new edges", next.nodes.size(), next.edges.size());
        set_highlight(std::move(next));
    }

    node_ids_ = std::move(nodes);
    edge_ids_ = std::move(edges);
    has_baseline_ = true;
    return true;
}

bool HighlightTracker::tick(float dt) {
    if (!countdown_.tick(dt)) return false;
    set_highlight({});
    return true;
}

void HighlightTracker::reset() {
    node_ids_.clear();
    edge_ids_.clear();
    last_generated_ms_.reset();
    has_baseline_ = false;
    set_highlight({});
}

void HighlightTracker::set_highlight(HighlightSet next) {
    const bool was_empty = highlight_.empty();
    highlight_ = std::move(next);
    if (highlight_.empty()) {
        countdown_.cancel();
        if (was_empty) return;
    } else {
        countdown_.start(highlight_seconds);
    }
    changed_.notify(highlight_);
}

} // namespace snapshot_diff
