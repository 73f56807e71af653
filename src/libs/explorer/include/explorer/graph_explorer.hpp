#pragma once

#include <canvas/canvas.hpp>
#include <explorer/diagnostics_port.hpp>
#include <explorer/explorer_config.hpp>
#include <explorer/filter_controller.hpp>
#include <graph_client/http_transport.hpp>
#include <graph_client/snapshot_client.hpp>
#include <graph_layout/layout_cache.hpp>
#include <graph_model/graph_index.hpp>
#include <snapshot_diff/snapshot_diff.hpp>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace explorer {

// Wires filters -> snapshot client -> highlight diff -> layout cache -> canvas,
// and draws the surrounding panels. Without a transport it runs offline and
// only shows snapshots handed to show_snapshot().
class GraphExplorer {
public:
    GraphExplorer(ExplorerConfig config, graph_client::HttpTransport* transport);
    ~GraphExplorer();
    GraphExplorer(const GraphExplorer&) = delete;
    GraphExplorer& operator=(const GraphExplorer&) = delete;

    void set_diagnostics_port(DiagnosticsPort port) { port_ = std::move(port); }

    // Issues the first request. No-op offline.
    void start();
    void show_snapshot(std::shared_ptr<const graph_model::Snapshot> snapshot);
    // Re-issues the current request with a new refresh key; stops replay.
    void refresh();

    // Delivers responses and advances replay and highlight timers.
    void update(float dt);
    // Draws into the current ImGui window. Defined in the explorer_ui library.
    void draw(float dt);

    bool offline() const { return !client_; }
    const ExplorerConfig& config() const { return config_; }
    FilterController& filters() { return filters_; }
    const FilterController& filters() const { return filters_; }
    canvas::GraphCanvas& graph_canvas() { return canvas_; }
    const graph_model::Snapshot* snapshot() const { return snapshot_.get(); }
    const graph_model::GraphIndex* graph() const { return index_.get(); }
    const graph_layout::LayoutCache& layout_cache() const { return layout_cache_; }
    const snapshot_diff::HighlightTracker& highlights() const { return highlights_; }
    const graph_client::SnapshotClient* client() const { return client_.get(); }
    const std::optional<std::string>& error() const { return error_; }
    const graph_model::GraphNode* selected_node() const;

    graph_client::RequestConfig request_config() const;

private:
    void fetch();
    void on_snapshot(std::shared_ptr<const graph_model::Snapshot> snapshot);
    void on_request(const graph_client::RequestInfo& info);
    void clear_snapshot();
    void update_focus();
    bool show_request_status() const;

    ExplorerConfig config_;
    FilterController filters_;
    ModalityCatalog modalities_;
    std::unique_ptr<graph_client::SnapshotClient> client_;
    int refresh_key_ = 0;
    std::shared_ptr<const graph_model::Snapshot> snapshot_;
    std::unique_ptr<graph_model::GraphIndex> index_;
    snapshot_diff::HighlightTracker highlights_;
    graph_layout::LayoutCache layout_cache_;
    canvas::GraphCanvas canvas_;
    std::optional<std::string> error_;
    DiagnosticsPort port_;
};

} // namespace explorer
