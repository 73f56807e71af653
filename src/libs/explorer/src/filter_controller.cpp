#include <explorer/filter_controller.hpp>
#include <graph_util/labels.hpp>
#include <graph_util/log.hpp>
#include <graph_util/time_format.hpp>
#include <algorithm>
#include <cmath>
#include <unordered_set>
#include <utility>

namespace explorer {

std::optional<TimeBounds> time_bounds_from_meta(const graph_model::SnapshotMeta& meta) {
    if (!meta.min_timestamp || !meta.max_timestamp) return std::nullopt;
    auto min_ms = graph_util::parse_iso8601_ms(*meta.min_timestamp);
    auto max_ms = graph_util::parse_iso8601_ms(*meta.max_timestamp);
    if (!min_ms || !max_ms || *min_ms == *max_ms) return std::nullopt;
    return TimeBounds{*min_ms, *max_ms};
}

FilterController::FilterController(graph_client::RequestFilters initial)
    : filters_(std::move(initial))
{
    filters_.limit = std::clamp(filters_.limit, min_limit, max_limit);
}

std::optional<std::string> FilterController::active_modality() const {
    if (filters_.modalities && filters_.modalities->size() == 1) return filters_.modalities->front();
    return std::nullopt;
}

std::optional<std::int64_t> FilterController::snapshot_at_ms() const {
    if (!filters_.snapshot_at) return std::nullopt;
    return graph_util::parse_iso8601_ms(*filters_.snapshot_at);
}

void FilterController::toggle_modality(const std::string& modality) {
    stop_replay();
    if (active_modality() == modality)
        filters_.modalities.reset();
    else
        filters_.modalities = std::vector<std::string>{modality};
    publish();
}

bool FilterController::set_limit(int limit) {
    stop_replay();
    limit = std::clamp(limit, min_limit, max_limit);
    if (limit == filters_.limit) return false;
    filters_.limit = limit;
    publish();
    return true;
}

bool FilterController::set_snapshot_at(std::optional<std::string> iso) {
    stop_replay();
    if (iso == filters_.snapshot_at) return false;
    filters_.snapshot_at = std::move(iso);
    publish();
    return true;
}

bool FilterController::set_snapshot_at_ms(std::int64_t epoch_ms) {
    return set_snapshot_at(graph_util::format_iso8601_ms(epoch_ms));
}

bool FilterController::go_live() {
    return set_snapshot_at(std::nullopt);
}

void FilterController::set_time_controls_enabled(bool enabled) {
    time_controls_enabled_ = enabled;
    if (!enabled) stop_replay();
}

bool FilterController::start_replay() {
    if (!time_controls_enabled_ || !time_bounds_) return false;
    replay_bounds_ = *time_bounds_;
    const double span = static_cast<double>(replay_bounds_.max_ms - replay_bounds_.min_ms);
    replay_step_ = std::max<std::int64_t>(1, std::llround(span / replay_steps));
    replay_value_ = snapshot_at_ms().value_or(replay_bounds_.min_ms);
    replay_timer_.start();
    graph_util::logger()->debug("Replay started: step {}ms from {}", replay_step_, replay_value_);
    return true;
}

void FilterController::stop_replay() {
    replay_timer_.stop();
}

bool FilterController::toggle_replay() {
    if (replaying()) {
        stop_replay();
        return false;
    }
    return start_replay();
}

bool FilterController::tick(float dt) {
    if (!replay_timer_.tick(dt)) return false;
    replay_value_ = std::min(replay_value_ + replay_step_, replay_bounds_.max_ms);
    filters_.snapshot_at = graph_util::format_iso8601_ms(replay_value_);
    if (replay_value_ >= replay_bounds_.max_ms) stop_replay();
    publish();
    return true;
}

namespace {

const char* const common_modalities[] = {
    "issue", "support", "git", "slack", "doc", "component", "service", "signal", "impact", "api", "repo",
};

} // namespace

ModalityCatalog::ModalityCatalog()
    : seen_(std::begin(common_modalities), std::end(common_modalities))
{
    observe({});
}

void ModalityCatalog::observe(const std::map<std::string, int>& modality_counts) {
    for (const auto& [id, count] : modality_counts) seen_.insert(id);

    options_.clear();
    for (const auto& id : seen_) {
        ModalityOption o;
        o.id = id;
        o.label = graph_util::humanize_label(id);
        auto it = modality_counts.find(id);
        o.count = it == modality_counts.end() ? 0 : it->second;
        o.color = graph_util::color_for_node(id, id);
        options_.push_back(std::move(o));
    }
    std::sort(options_.begin(), options_.end(), [](const ModalityOption& a, const ModalityOption& b) {
        if (a.count != b.count) return a.count > b.count;
        return a.label < b.label;
    });
}

std::vector<std::string> focus_node_ids(const std::vector<const graph_model::GraphNode*>& nodes,
    const std::optional<std::vector<std::string>>& modalities)
{
    std::vector<std::string> all;
    all.reserve(nodes.size());
    for (const auto* n : nodes) all.push_back(n->id);
    if (!modalities || modalities->empty()) return all;

    const std::unordered_set<std::string> wanted(modalities->begin(), modalities->end());
    std::vector<std::string> subset;
    for (const auto* n : nodes) {
        const std::string& key = n->modality.empty() ? n->label : n->modality;
        if (wanted.count(key)) subset.push_back(n->id);
    }
    return subset.empty() ? all : subset;
}

} // namespace explorer
