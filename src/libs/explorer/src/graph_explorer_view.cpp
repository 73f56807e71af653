#include <explorer/graph_explorer.hpp>
#include <explorer/panels.hpp>
#include "imgui.h"
#include <algorithm>

namespace explorer {

namespace {

constexpr float side_panel_width = 280.0f;
constexpr float details_panel_width = 320.0f;

} // namespace

bool GraphExplorer::show_request_status() const {
    const bool loading = client_ && client_->pending();
    return !loading && (!index_ || index_->empty());
}

void GraphExplorer::draw(float dt) {
    if (!config_.title.empty()) ImGui::TextUnformatted(config_.title.c_str());
    draw_filter_bar(filters_, modalities_);
    ImGui::Separator();

    const float footer_height = ImGui::GetFrameHeightWithSpacing() + ImGui::GetStyle().ItemSpacing.y;
    const ImVec2 avail = ImGui::GetContentRegionAvail();
    const float body_height = std::max(0.0f, avail.y - footer_height);

    ImGui::BeginChild("overview", ImVec2(side_panel_width, body_height), true);
    draw_overview(snapshot_ ? &snapshot_->meta : nullptr, canvas_);
    ImGui::EndChild();

    ImGui::SameLine();
    const float spacing = ImGui::GetStyle().ItemSpacing.x;
    const float center_width = std::max(0.0f, avail.x - side_panel_width - details_panel_width - spacing * 2.0f);
    ImGui::BeginChild("graph", ImVec2(center_width, body_height), false,
        ImGuiWindowFlags_NoScrollbar | ImGuiWindowFlags_NoScrollWithMouse);
    const ImVec2 canvas_size = ImGui::GetContentRegionAvail();
    if (canvas_size.x > 0 && canvas_size.y > 0) {
        canvas_.update_and_draw(canvas_size.x, canvas_size.y, dt);
        if (show_request_status()) {
            const std::optional<graph_client::RequestInfo> none;
            const auto& info = client_ ? client_->current() : none;
            ImGui::SetCursorPos(ImVec2(24.0f, 24.0f));
            const ImVec2 status_size(std::min(canvas_size.x - 48.0f, 560.0f), std::min(canvas_size.y - 48.0f, 300.0f));
            ImGui::BeginChild("request_status", status_size, true);
            if (draw_request_status(info, graph_client::build_request_target(request_config()), error_))
                refresh();
            ImGui::EndChild();
        }
    }
    ImGui::EndChild();

    ImGui::SameLine();
    ImGui::BeginChild("details", ImVec2(details_panel_width, body_height), true);
    draw_node_details(selected_node());
    ImGui::EndChild();

    switch (draw_snapshot_footer(snapshot_.get(), !config_.lock_viewport)) {
    case FooterAction::Refresh:
        refresh();
        break;
    case FooterAction::ResetView:
        canvas_.reset_view();
        break;
    case FooterAction::None:
        break;
    }

    if (config_.show_diagnostics) draw_diagnostics_window(client_.get(), canvas_);
}

} // namespace explorer
