#include <graph_util/node_colors.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <unordered_map>

namespace graph_util {

namespace {

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

const std::unordered_map<std::string, Rgba>& type_colors() {
    static const std::unordered_map<std::string, Rgba> colors = {
        {"component", {249, 115, 22, 1.0f}},
        {"service", {14, 165, 233, 1.0f}},
        {"api", {56, 189, 248, 1.0f}},
        {"apiendpoint", {56, 189, 248, 1.0f}},
        {"doc", {248, 113, 113, 1.0f}},
        {"git", {251, 191, 36, 1.0f}},
        {"gitevent", {251, 191, 36, 1.0f}},
        {"pr", {250, 204, 21, 1.0f}},
        {"slack", {96, 165, 250, 1.0f}},
        {"slackevent", {96, 165, 250, 1.0f}},
        {"slackthread", {129, 140, 248, 1.0f}},
        {"issue", {244, 63, 94, 1.0f}},
        {"tickets", {251, 146, 60, 1.0f}},
        {"support", {192, 132, 252, 1.0f}},
        {"supportcase", {192, 132, 252, 1.0f}},
        {"signal", {196, 181, 253, 1.0f}},
        {"activitysignal", {196, 181, 253, 1.0f}},
        {"impact", {244, 114, 182, 1.0f}},
        {"impactevent", {244, 114, 182, 1.0f}},
        {"repo", {45, 212, 191, 1.0f}},
        {"repository", {45, 212, 191, 1.0f}},
        {"codeartifact", {74, 222, 128, 1.0f}},
    };
    return colors;
}

const std::array<Rgba, 8> fallback_palette = {{
    {148, 163, 184, 1.0f},
    {163, 230, 53, 1.0f},
    {34, 211, 238, 1.0f},
    {232, 121, 249, 1.0f},
    {253, 224, 71, 1.0f},
    {110, 231, 183, 1.0f},
    {251, 113, 133, 1.0f},
    {165, 180, 252, 1.0f},
}};

std::uint32_t string_hash(const std::string& s) {
    std::uint32_t hash = 0;
    for (unsigned char c : s) hash = hash * 31u + c;
    return hash;
}

} // namespace

Rgba with_alpha(Rgba color, float alpha) {
    color.a = alpha;
    return color;
}

Rgba color_for_node(const std::string& label, const std::string& modality) {
    const auto& colors = type_colors();
    const std::string mod = to_lower(modality);
    const std::string lab = to_lower(label);
    if (!mod.empty()) {
        if (auto it = colors.find(mod); it != colors.end()) return it->second;
    }
    if (!lab.empty()) {
        if (auto it = colors.find(lab); it != colors.end()) return it->second;
    }
    const std::string& key = !mod.empty() ? mod : lab;
    if (key.empty()) return fallback_palette[0];
    return fallback_palette[string_hash(key) % fallback_palette.size()];
}

} // namespace graph_util
