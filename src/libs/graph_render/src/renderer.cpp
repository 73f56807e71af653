#include <graph_render/renderer.hpp>
#include <graph_render/edge_styles.hpp>
#include "imgui.h"
#include <algorithm>
#include <cfloat>
#include <cmath>

namespace graph_render {

namespace {

const char* placeholder_text = "Loading graph...";

ImU32 to_imu32(const graph_util::Rgba& c, float alpha_scale = 1.0f) {
    const float a = std::clamp(c.a * alpha_scale, 0.0f, 1.0f);
    return IM_COL32(c.r, c.g, c.b, static_cast<int>(std::lround(a * 255.0f)));
}

graph_util::Rgba lerp(const graph_util::Rgba& from, const graph_util::Rgba& to, float t) {
    auto mix = [t](std::uint8_t a, std::uint8_t b) {
        return static_cast<std::uint8_t>(std::lround(a + (static_cast<float>(b) - a) * t));
    };
    return { mix(from.r, to.r), mix(from.g, to.g), mix(from.b, to.b), from.a + (to.a - from.a) * t };
}

struct Projector {
    const RenderTransform& t;
    ImVec2 operator()(const graph_layout::Point& w) const {
        return ImVec2(
            t.origin_x + static_cast<float>((w.x + t.pan_x) * t.scale) + t.width * 0.5f,
            t.origin_y + static_cast<float>((w.y + t.pan_y) * t.scale) + t.height * 0.5f);
    }
};

void draw_edges(ImDrawList* dl, const Scene& scene, const Projector& project, float zoom, float fade) {
    ImFont* font = ImGui::GetFont();
    const float label_size = metrics::edge_label_font * zoom;
    for (const auto& e : scene.edges) {
        const graph_util::Rgba color = e.recent ? lerp(e.base_color, e.color, fade) : e.color;
        const float width = e.recent ? e.base_width + (e.width - e.base_width) * fade : e.width;
        dl->AddLine(project(e.from), project(e.to), to_imu32(color), width * zoom);

        if (e.type_label.empty()) continue;
        const ImVec2 anchor = project(e.label_pos);
        const float w = font->CalcTextSizeA(label_size, FLT_MAX, 0.0f, e.type_label.c_str()).x;
        // Baseline sits at the label position, centered horizontally.
        dl->AddText(font, label_size, ImVec2(anchor.x - w * 0.5f, anchor.y - label_size),
            to_imu32(palette::edge_label), e.type_label.c_str());
    }
}

void draw_nodes(ImDrawList* dl, const Scene& scene, const Projector& project, float zoom, float fade) {
    ImFont* font = ImGui::GetFont();
    const float title_size = metrics::title_font * zoom;
    for (const auto& n : scene.nodes) {
        const ImVec2 center = project(n.center);
        dl->AddCircleFilled(center, n.radius * zoom, to_imu32(n.fill, n.dimmed ? metrics::dimmed_alpha : 1.0f));
        for (const auto& ring : n.rings) {
            const float alpha = ring.recent ? fade : 1.0f;
            if (alpha <= 0.0f) continue;
            dl->AddCircle(center, ring.radius * zoom, to_imu32(ring.color, alpha), 0, ring.width * zoom);
        }
        if (!n.title) continue;
        const ImVec2 pos = project(n.title_pos);
        const ImVec2 top_left(pos.x, pos.y - title_size);
        const char* text = n.title->c_str();
        const ImU32 outline = to_imu32(palette::title_outline);
        for (int dx = -1; dx <= 1; ++dx) {
            for (int dy = -1; dy <= 1; ++dy) {
                if (dx == 0 && dy == 0) continue;
                dl->AddText(font, title_size, ImVec2(top_left.x + dx, top_left.y + dy), outline, text);
            }
        }
        dl->AddText(font, title_size, top_left, to_imu32(palette::title_text), text);
    }
}

void draw_tooltips(ImDrawList* dl, const Scene& scene, const Projector& project, const RenderTransform& t, float zoom) {
    ImFont* font = ImGui::GetFont();
    const float font_size = metrics::tooltip_font * zoom;
    const float min_x = t.origin_x;
    const float min_y = t.origin_y;
    const float max_x = t.origin_x + t.width;
    const float max_y = t.origin_y + t.height;
    for (const auto& tip : scene.tooltips) {
        ImVec2 p0 = project(tip.origin);
        const float w = tip.width * zoom;
        const float h = tip.height * zoom;
        p0.x = std::max(min_x, std::min(p0.x, max_x - w));
        p0.y = std::max(min_y, std::min(p0.y, max_y - h));
        const ImVec2 p1(p0.x + w, p0.y + h);
        const float rounding = std::min(metrics::tooltip_corner_radius * zoom, std::min(w, h) * 0.5f);
        dl->AddRectFilled(p0, p1, to_imu32(palette::tooltip_fill), rounding);
        dl->AddRect(p0, p1, to_imu32(palette::tooltip_border), rounding);
        for (std::size_t i = 0; i < tip.lines.size(); ++i) {
            const float baseline = p0.y + (metrics::tooltip_padding_y + metrics::tooltip_line_height * (static_cast<float>(i) + 0.8f)) * zoom;
            dl->AddText(font, font_size, ImVec2(p0.x + metrics::tooltip_padding_x * zoom, baseline - font_size),
                to_imu32(palette::tooltip_text), tip.lines[i].c_str());
        }
    }
}

} // namespace

float measure_text(const std::string& text, float font_size) {
    return ImGui::GetFont()->CalcTextSizeA(font_size, FLT_MAX, 0.0f, text.c_str()).x;
}

void render_scene(ImDrawList* draw_list,
    const Scene& scene,
    const RenderTransform& transform,
    float highlight_fade)
{
    if (!draw_list) return;

    const ImVec2 region_min(transform.origin_x, transform.origin_y);
    const ImVec2 region_max(transform.origin_x + transform.width, transform.origin_y + transform.height);
    draw_list->PushClipRect(region_min, region_max, true);
    draw_list->AddRectFilled(region_min, region_max, to_imu32(palette::background));

    if (scene.empty()) {
        const ImVec2 size = ImGui::CalcTextSize(placeholder_text);
        draw_list->AddText(
            ImVec2(region_min.x + (transform.width - size.x) * 0.5f, region_min.y + (transform.height - size.y) * 0.5f),
            to_imu32(palette::placeholder_text), placeholder_text);
        draw_list->PopClipRect();
        return;
    }

    const Projector project{ transform };
    const float zoom = static_cast<float>(transform.scale);
    const float fade = std::clamp(highlight_fade, 0.0f, 1.0f);
    draw_edges(draw_list, scene, project, zoom, fade);
    draw_nodes(draw_list, scene, project, zoom, fade);
    draw_tooltips(draw_list, scene, project, transform, zoom);
    draw_list->PopClipRect();
}

} // namespace graph_render
