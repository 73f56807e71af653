#include <explorer/panels.hpp>
#include <graph_client/request_config.hpp>
#include <graph_util/deep_links.hpp>
#include <graph_util/labels.hpp>
#include <graph_util/node_colors.hpp>
#include <graph_util/time_format.hpp>
#include "imgui.h"
#include <algorithm>
#include <map>
#include <spdlog/fmt/fmt.h>
#include <utility>
#include <vector>

namespace explorer {

namespace {

constexpr std::size_t max_property_keys = 30;
const ImVec4 muted_text(0.58f, 0.64f, 0.72f, 1.0f);
const ImVec4 error_text(0.98f, 0.55f, 0.55f, 1.0f);

ImVec4 to_imvec4(const graph_util::Rgba& c) {
    return ImVec4(c.r / 255.0f, c.g / 255.0f, c.b / 255.0f, c.a);
}

// Keeps the next item on the current line when it fits.
void flow_same_line(float next_width, bool first) {
    if (first) return;
    const ImGuiStyle& style = ImGui::GetStyle();
    const float line_end = ImGui::GetItemRectMax().x + style.ItemSpacing.x + next_width;
    const float right = ImGui::GetWindowPos().x + ImGui::GetWindowContentRegionMax().x;
    if (line_end < right) ImGui::SameLine();
}

std::vector<std::pair<std::string, int>> sorted_counts(const std::map<std::string, int>& counts) {
    std::vector<std::pair<std::string, int>> out(counts.begin(), counts.end());
    std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.second > b.second; });
    return out;
}

void section_title(const char* title) {
    ImGui::Spacing();
    ImGui::TextColored(muted_text, "%s", title);
}

} // namespace

void draw_filter_bar(FilterController& filters, const ModalityCatalog& modalities) {
    const auto active = filters.active_modality();
    bool first = true;
    for (const auto& option : modalities.options()) {
        const std::string text = fmt::format("{} ({})##modality_{}", option.label, option.count, option.id);
        const float swatch = ImGui::GetFrameHeight() * 0.5f;
        const ImVec2 text_size = ImGui::CalcTextSize(text.c_str(), nullptr, true);
        flow_same_line(swatch + ImGui::GetStyle().ItemInnerSpacing.x + text_size.x, first);
        first = false;

        ImGui::ColorButton(("##swatch_" + option.id).c_str(), to_imvec4(option.color),
            ImGuiColorEditFlags_NoTooltip | ImGuiColorEditFlags_NoBorder, ImVec2(swatch, swatch));
        ImGui::SameLine(0.0f, ImGui::GetStyle().ItemInnerSpacing.x);
        const bool selected = active && *active == option.id;
        if (ImGui::Selectable(text.c_str(), selected, 0, text_size))
            filters.toggle_modality(option.id);
    }

    int limit = filters.filters().limit;
    ImGui::SetNextItemWidth(220.0f);
    ImGui::SliderInt("Limit", &limit, FilterController::min_limit, FilterController::max_limit);
    if (ImGui::IsItemDeactivatedAfterEdit()) filters.set_limit(limit);

    if (!filters.time_controls_enabled()) return;
    const auto& bounds = filters.time_bounds();
    if (!bounds) {
        ImGui::SameLine();
        ImGui::TextColored(muted_text, "No timestamps to replay");
        return;
    }

    std::int64_t value = filters.snapshot_at_ms().value_or(bounds->max_ms);
    value = std::clamp(value, bounds->min_ms, bounds->max_ms);
    ImGui::SameLine();
    ImGui::SetNextItemWidth(280.0f);
    const std::string shown = filters.filters().snapshot_at
        ? graph_util::format_timestamp(graph_util::format_iso8601_ms(value))
        : std::string("Live");
    ImGui::SliderScalar("##snapshot_at", ImGuiDataType_S64, &value, &bounds->min_ms, &bounds->max_ms, shown.c_str());
    if (ImGui::IsItemDeactivatedAfterEdit()) filters.set_snapshot_at_ms(value);

    ImGui::SameLine();
    ImGui::BeginDisabled(!filters.filters().snapshot_at);
    if (ImGui::Button("Live")) filters.go_live();
    ImGui::EndDisabled();
    ImGui::SameLine();
    if (ImGui::Button(filters.replaying() ? "Stop replay" : "Replay")) filters.toggle_replay();
}

void draw_overview(const graph_model::SnapshotMeta* meta, canvas::GraphCanvas& canvas) {
    ImGui::TextUnformatted("Overview");
    ImGui::Separator();
    if (!meta) {
        ImGui::TextColored(muted_text, "No snapshot");
        return;
    }

    section_title("Node labels");
    const auto& label_filter = canvas.label_filter();
    const auto labels = sorted_counts(meta->node_label_counts);
    if (labels.empty()) ImGui::TextColored(muted_text, "No labels");
    for (const auto& [label, count] : labels) {
        const std::string humanized = graph_util::humanize_label(label);
        ImGui::ColorButton(("##label_swatch_" + label).c_str(), to_imvec4(graph_util::color_for_node(label, "")),
            ImGuiColorEditFlags_NoTooltip | ImGuiColorEditFlags_NoBorder,
            ImVec2(ImGui::GetTextLineHeight() * 0.6f, ImGui::GetTextLineHeight() * 0.6f));
        ImGui::SameLine();
        const bool active = label_filter && *label_filter == label;
        const std::string text = fmt::format("{}  {}##label_{}", label, count, label);
        if (ImGui::Selectable(text.c_str(), active))
            canvas.set_label_filter(active ? std::nullopt : std::optional<std::string>(label));
        if (ImGui::IsItemHovered()) ImGui::SetTooltip("%s", humanized.c_str());
    }

    section_title("Relationship types");
    const auto rels = sorted_counts(meta->rel_type_counts);
    if (rels.empty()) ImGui::TextColored(muted_text, "No relationships");
    for (const auto& [rel, count] : rels)
        ImGui::BulletText("%s (%d)", rel.c_str(), count);

    section_title("Property keys");
    if (meta->property_keys.empty()) ImGui::TextColored(muted_text, "No properties");
    const std::size_t shown = std::min(meta->property_keys.size(), max_property_keys);
    for (std::size_t i = 0; i < shown; ++i)
        ImGui::TextUnformatted(meta->property_keys[i].c_str());
    if (meta->property_keys.size() > max_property_keys)
        ImGui::TextColored(muted_text, "+%zu more", meta->property_keys.size() - max_property_keys);

    if (!meta->missing_timestamp_labels.empty()) {
        section_title("Missing timestamps");
        for (const auto& label : meta->missing_timestamp_labels)
            ImGui::TextUnformatted(label.c_str());
    }
}

void draw_node_details(const graph_model::GraphNode* node) {
    ImGui::TextUnformatted("Node details");
    ImGui::Separator();
    if (!node) {
        ImGui::TextColored(muted_text, "Select a node to inspect it");
        return;
    }

    ImGui::TextColored(to_imvec4(graph_util::color_for_node(node->label, node->modality)), "%s", node->title.c_str());
    ImGui::TextColored(muted_text, "%s", node->id.c_str());
    if (ImGui::BeginTable("node_fields", 2, ImGuiTableFlags_SizingStretchProp)) {
        auto row = [](const char* key, const std::string& value) {
            ImGui::TableNextRow();
            ImGui::TableSetColumnIndex(0);
            ImGui::TextColored(muted_text, "%s", key);
            ImGui::TableSetColumnIndex(1);
            ImGui::TextWrapped("%s", value.c_str());
        };
        row("Label", node->label);
        row("Modality", node->modality.empty() ? std::string("-") : graph_util::humanize_label(node->modality));
        row("Created", graph_util::format_timestamp(node->created_at));
        row("Updated", graph_util::format_timestamp(node->updated_at));
        ImGui::EndTable();
    }

    const auto links = graph_util::extract_deep_links(node->props);
    if (!links.empty()) {
        section_title("Links");
        for (const auto& link : links) {
            ImGui::PushID(link.key.c_str());
            ImGui::TextLinkOpenURL(link.label.c_str(), link.url.c_str());
            ImGui::PopID();
            if (ImGui::IsItemHovered()) ImGui::SetTooltip("%s", link.url.c_str());
        }
    }

    if (!node->props.empty()) {
        section_title("Properties");
        if (ImGui::BeginTable("node_props", 2, ImGuiTableFlags_SizingStretchProp | ImGuiTableFlags_RowBg)) {
            for (const auto& [key, value] : node->props) {
                ImGui::TableNextRow();
                ImGui::TableSetColumnIndex(0);
                ImGui::TextColored(muted_text, "%s", key.c_str());
                ImGui::TableSetColumnIndex(1);
                ImGui::TextWrapped("%s", graph_util::truncate_label(value, 240).c_str());
            }
            ImGui::EndTable();
        }
    }
}

FooterAction draw_snapshot_footer(const graph_model::Snapshot* snapshot, bool allow_reset_view) {
    FooterAction action = FooterAction::None;
    const std::string generated = snapshot ? graph_util::format_timestamp(snapshot->generated_at) : std::string("-");
    const std::size_t nodes = snapshot ? snapshot->nodes.size() : 0;
    const std::size_t edges = snapshot ? snapshot->edges.size() : 0;
    ImGui::TextColored(muted_text, "Snapshot generated %s | %zu nodes | %zu edges", generated.c_str(), nodes, edges);
    if (snapshot && snapshot->meta.min_timestamp && snapshot->meta.max_timestamp) {
        ImGui::SameLine();
        ImGui::TextColored(muted_text, "| %s -> %s",
            graph_util::format_timestamp(*snapshot->meta.min_timestamp).c_str(),
            graph_util::format_timestamp(*snapshot->meta.max_timestamp).c_str());
    }
    ImGui::SameLine();
    if (ImGui::Button("Refresh")) action = FooterAction::Refresh;
    if (allow_reset_view) {
        ImGui::SameLine();
        if (ImGui::Button("Reset view")) action = FooterAction::ResetView;
    }
    return action;
}

bool draw_request_status(const std::optional<graph_client::RequestInfo>& info,
    const std::string& fallback_target,
    const std::optional<std::string>& error)
{
    const std::string target = info ? info->target : fallback_target;
    ImGui::TextUnformatted("No nodes to display");
    ImGui::Separator();
    if (info) {
        ImGui::Text("Status: %s", graph_client::request_status_name(info->status));
        if (info->http_status) ImGui::Text("HTTP %d", *info->http_status);
        if (info->duration_ms) ImGui::Text("Duration: %lld ms", static_cast<long long>(*info->duration_ms));
        ImGui::Text("Started: %s", graph_util::format_timestamp(graph_util::format_iso8601_ms(info->started_at_ms)).c_str());
        if (info->error_kind)
            ImGui::Text("Error kind: %s", graph_client::error_kind_name(*info->error_kind));
    } else {
        ImGui::TextColored(muted_text, "No request has been issued");
    }
    if (error) ImGui::TextColored(error_text, "%s", error->c_str());
    else if (info && !info->error_message.empty()) ImGui::TextColored(error_text, "%s", info->error_message.c_str());

    ImGui::Spacing();
    ImGui::TextColored(muted_text, "Target");
    ImGui::TextWrapped("%s", target.c_str());
    const std::string command = graph_client::fetch_command(target);
    ImGui::TextColored(muted_text, "Fetch command");
    ImGui::TextWrapped("%s", command.c_str());
    if (ImGui::Button("Copy command")) ImGui::SetClipboardText(command.c_str());
    ImGui::SameLine();
    return ImGui::Button("Retry");
}

void draw_diagnostics_window(const graph_client::SnapshotClient* client, const canvas::GraphCanvas& canvas) {
    ImGui::SetNextWindowSize(ImVec2(520, 320), ImGuiCond_FirstUseEver);
    if (!ImGui::Begin("Diagnostics")) {
        ImGui::End();
        return;
    }
    const auto& view = canvas.viewport().state();
    ImGui::Text("View: scale %.3f pan (%.1f, %.1f)", view.scale, view.pan_x, view.pan_y);
    ImGui::Text("Pointer: %s", canvas::pointer_state_name(canvas.pointer().state()));
    if (!client) {
        ImGui::TextColored(muted_text, "Offline");
        ImGui::End();
        return;
    }
    if (const auto& current = client->current())
        ImGui::TextWrapped("Current: %s", graph_client::describe(*current).c_str());
    ImGui::Separator();
    const auto& history = client->history();
    for (auto it = history.rbegin(); it != history.rend(); ++it)
        ImGui::TextWrapped("%s", graph_client::describe(*it).c_str());
    ImGui::End();
}

} // namespace explorer
