#include <explorer/graph_explorer.hpp>
#include <graph_util/log.hpp>

namespace explorer {

namespace {

graph_client::RequestFilters initial_filters(const ExplorerConfig& config) {
    graph_client::RequestFilters f;
    f.modalities = config.modalities;
    f.limit = config.limit;
    f.snapshot_at = config.snapshot_at;
    return f;
}

} // namespace

GraphExplorer::GraphExplorer(ExplorerConfig config, graph_client::HttpTransport* transport)
    : config_(std::move(config))
    , filters_(initial_filters(config_))
    , layout_cache_(config_.layout_config)
{
    filters_.set_time_controls_enabled(time_controls_enabled(config_));
    filters_.changed().subscribe([this](const graph_client::RequestFilters&) {
        update_focus();
        if (client_) fetch();
    });

    if (transport) {
        client_ = std::make_unique<graph_client::SnapshotClient>(*transport);
        client_->set_on_snapshot([this](std::shared_ptr<const graph_model::Snapshot> s) { on_snapshot(std::move(s)); });
        client_->set_on_request([this](const graph_client::RequestInfo& info) { on_request(info); });
    }

    highlights_.changed().subscribe([this](const snapshot_diff::HighlightSet&) { canvas_.mark_scene_dirty(); });
    canvas_.set_locked(config_.lock_viewport);
    canvas_.set_highlight(&highlights_.highlight());
    canvas_.viewport().changed().subscribe([this](const canvas::ViewState& state) {
        if (port_.on_view_state) port_.on_view_state(state);
    });
}

GraphExplorer::~GraphExplorer() {
    filters_.stop_replay();
    canvas_.set_graph(nullptr);
    canvas_.set_layout(nullptr, 0);
}

graph_client::RequestConfig GraphExplorer::request_config() const {
    graph_client::RequestConfig rc;
    rc.mode = config_.mode;
    rc.root_node_id = config_.root_node_id;
    rc.depth = config_.depth;
    rc.project_id = config_.project_id;
    rc.filters = filters_.filters();
    rc.api_base = config_.api_base;
    rc.endpoint_path = config_.endpoint_path;
    rc.timeout_seconds = config_.timeout_seconds;
    rc.refresh_key = refresh_key_;
    return rc;
}

void GraphExplorer::start() {
    if (client_) fetch();
}

void GraphExplorer::fetch() {
    client_->fetch(request_config());
}

void GraphExplorer::refresh() {
    filters_.stop_replay();
    if (!client_) {
        graph_util::logger()->info("Offline: nothing to refresh");
        return;
    }
    ++refresh_key_;
    fetch();
}

void GraphExplorer::show_snapshot(std::shared_ptr<const graph_model::Snapshot> snapshot) {
    on_snapshot(std::move(snapshot));
}

const graph_model::GraphNode* GraphExplorer::selected_node() const {
    const auto& selected = canvas_.selection().selected();
    if (!selected || !index_) return nullptr;
    return index_->find_node(*selected);
}

void GraphExplorer::on_request(const graph_client::RequestInfo& info) {
    if (info.status == graph_client::RequestStatus::Pending) {
        error_.reset();
    } else if (info.status == graph_client::RequestStatus::Error) {
        error_ = info.error_message;
        clear_snapshot();
    }
    if (port_.on_request) port_.on_request(info);
}

void GraphExplorer::on_snapshot(std::shared_ptr<const graph_model::Snapshot> snapshot) {
    if (!snapshot) return;
    if (!highlights_.on_snapshot(*snapshot)) {
        graph_util::logger()->debug("Ignoring snapshot generated at {} (older than current)", snapshot->generated_at);
        return;
    }
    graph_util::logger()->debug("Snapshot received: {} nodes, {} edges", snapshot->nodes.size(), snapshot->edges.size());

    auto next = std::make_unique<graph_model::GraphIndex>(snapshot);
    if (next->dropped_edge_count() > 0)
        graph_util::logger()->debug("Dropped {} edges referencing missing nodes", next->dropped_edge_count());
    canvas_.set_graph(next.get());
    index_ = std::move(next);
    snapshot_ = std::move(snapshot);

    modalities_.observe(snapshot_->meta.modality_counts);
    filters_.set_time_bounds(time_bounds_from_meta(snapshot_->meta));

    layout_cache_.update(snapshot_->nodes, config_.layout);
    update_focus();
    canvas_.set_layout(&layout_cache_.layout(), layout_cache_.version());
    if (port_.on_layout) port_.on_layout(layout_cache_.layout(), layout_cache_.strategy());
}

void GraphExplorer::clear_snapshot() {
    if (!snapshot_) return;
    canvas_.set_graph(nullptr);
    canvas_.set_layout(nullptr, 0);
    layout_cache_.clear();
    index_.reset();
    snapshot_.reset();
    filters_.set_time_bounds(std::nullopt);
}

void GraphExplorer::update_focus() {
    if (!index_) return;
    canvas_.set_focus_nodes(focus_node_ids(index_->nodes(), filters_.filters().modalities));
}

void GraphExplorer::update(float dt) {
    if (client_) client_->poll();
    filters_.tick(dt);
    highlights_.tick(dt);
    canvas_.set_highlight_fade(highlights_.fade());
}

} // namespace explorer
