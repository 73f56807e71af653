#pragma once

#include <canvas/canvas.hpp>
#include <explorer/filter_controller.hpp>
#include <graph_client/request_info.hpp>
#include <graph_client/snapshot_client.hpp>
#include <graph_model/types.hpp>
#include <optional>
#include <string>

namespace explorer {

// Modality chips, limit slider and (when enabled) the time slider with Live and Replay.
void draw_filter_bar(FilterController& filters, const ModalityCatalog& modalities);

// Label counts (click toggles the canvas label filter), relationship counts, property keys.
void draw_overview(const graph_model::SnapshotMeta* meta, canvas::GraphCanvas& canvas);

void draw_node_details(const graph_model::GraphNode* node);

enum class FooterAction { None, Refresh, ResetView };

FooterAction draw_snapshot_footer(const graph_model::Snapshot* snapshot, bool allow_reset_view);

// Last request, reproducible fetch command and Retry. Returns true when Retry was pressed.
bool draw_request_status(const std::optional<graph_client::RequestInfo>& info,
    const std::string& fallback_target,
    const std::optional<std::string>& error);

// Request history plus the current view state.
void draw_diagnostics_window(const graph_client::SnapshotClient* client, const canvas::GraphCanvas& canvas);

} // namespace explorer
