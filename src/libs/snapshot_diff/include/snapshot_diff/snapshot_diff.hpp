#pragma once

#include <animation/timers.hpp>
#include <graph_model/types.hpp>
#include <graph_util/change_notifier.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>

namespace snapshot_diff {

struct HighlightSet {
    std::unordered_set<std::string> nodes;
    std::unordered_set<std::string> edges;

    bool empty() const { return nodes.empty() && edges.empty(); }
    bool has_node(const std::string& id) const { return nodes.count(id) != 0; }
    bool has_edge(const std::string& id) const { return edges.count(id) != 0; }
};

// Ids present in current but not in previous. Removed ids never appear.
HighlightSet diff_snapshots(const graph_model::Snapshot& previous, const graph_model::Snapshot& current);

// Holds the previous snapshot's id sets and the transient highlight.
// The first snapshot of a session only seeds the id sets.
class HighlightTracker {
public:
    static constexpr float highlight_seconds = 1.8f;

    // Returns false when the snapshot was ignored (older generatedAt than the last one seen).
    bool on_snapshot(const graph_model::Snapshot& snapshot);
    // Advances the clear timer; returns true when the highlight was cleared on this tick.
    bool tick(float dt);
    void reset();

    const HighlightSet& highlight() const { return highlight_; }
    // 1 when a highlight is fresh, falling to 0 when it clears.
    float fade() const { return countdown_.fraction_remaining(); }
    bool has_baseline() const { return has_baseline_; }

    graph_util::ChangeNotifier<const HighlightSet&>& changed() { return changed_; }

private:
    void set_highlight(HighlightSet next);

    std::unordered_set<std::string> node_ids_;
    std::unordered_set<std::string> edge_ids_;
    std::optional<std::int64_t> last_generated_ms_;
    bool has_baseline_ = false;
    HighlightSet highlight_;
    animation::Countdown countdown_;
    graph_util::ChangeNotifier<const HighlightSet&> changed_;
};

} // namespace snapshot_diff
