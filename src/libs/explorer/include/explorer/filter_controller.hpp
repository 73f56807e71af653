#pragma once

#include <animation/timers.hpp>
#include <graph_client/request_config.hpp>
#include <graph_model/types.hpp>
#include <graph_util/change_notifier.hpp>
#include <graph_util/node_colors.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace explorer {

struct TimeBounds {
    std::int64_t min_ms = 0;
    std::int64_t max_ms = 0;
};

// nullopt when either bound is missing or unparsable, or when min == max.
std::optional<TimeBounds> time_bounds_from_meta(const graph_model::SnapshotMeta& meta);

// Modality filter, result limit and point-in-time selection, plus replay.
// Every change to filters() is published through changed().
class FilterController {
public:
    static constexpr int min_limit = 25;
    static constexpr int max_limit = 1200;
    static constexpr int replay_steps = 16;
    static constexpr float replay_interval_seconds = 1.2f;

    explicit FilterController(graph_client::RequestFilters initial = {});

    const graph_client::RequestFilters& filters() const { return filters_; }
    // The single active modality, if the filter holds exactly one.
    std::optional<std::string> active_modality() const;
    std::optional<std::int64_t> snapshot_at_ms() const;

    // Selecting the active modality clears the filter; any other replaces it.
    void toggle_modality(const std::string& modality);
    bool set_limit(int limit);
    bool set_snapshot_at(std::optional<std::string> iso);
    bool set_snapshot_at_ms(std::int64_t epoch_ms);
    // Back to the current snapshot. Stops replay.
    bool go_live();

    // Disabling also stops replay.
    void set_time_controls_enabled(bool enabled);
    bool time_controls_enabled() const { return time_controls_enabled_; }
    void set_time_bounds(std::optional<TimeBounds> bounds) { time_bounds_ = bounds; }
    const std::optional<TimeBounds>& time_bounds() const { return time_bounds_; }

    // Steps snapshot_at from its current value (or min) to max in replay_steps
    // increments. Returns false without time controls or bounds.
    bool start_replay();
    void stop_replay();
    bool toggle_replay();
    bool replaying() const { return replay_timer_.running(); }
    // Returns true when a replay step changed the filters.
    bool tick(float dt);

    graph_util::ChangeNotifier<const graph_client::RequestFilters&>& changed() { return changed_; }

private:
    void publish() { changed_.notify(filters_); }

    graph_client::RequestFilters filters_;
    bool time_controls_enabled_ = true;
    std::optional<TimeBounds> time_bounds_;
    TimeBounds replay_bounds_;
    std::int64_t replay_step_ = 1;
    std::int64_t replay_value_ = 0;
    animation::IntervalTimer replay_timer_{replay_interval_seconds};
    graph_util::ChangeNotifier<const graph_client::RequestFilters&> changed_;
};

struct ModalityOption {
    std::string id;
    std::string label;
    int count = 0;
    graph_util::Rgba color;
};

// Every modality seen during the session (seeded with the common ones), so a
// filtered snapshot still offers the others. Sorted by count, then label.
class ModalityCatalog {
public:
    ModalityCatalog();

    void observe(const std::map<std::string, int>& modality_counts);
    const std::vector<ModalityOption>& options() const { return options_; }

private:
    std::set<std::string> seen_;
    std::vector<ModalityOption> options_;
};

// Nodes matching the modality filter (by modality, else label); all nodes when
// the filter is empty or nothing matches.
std::vector<std::string> focus_node_ids(const std::vector<const graph_model::GraphNode*>& nodes,
    const std::optional<std::vector<std::string>>& modalities);

} // namespace explorer
