#pragma once

#include <cstdint>
#include <string>

namespace graph_util {

struct Rgba {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
    float a = 1.0f;

    bool operator==(const Rgba& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }
    bool operator!=(const Rgba& other) const { return !(*this == other); }
};

Rgba with_alpha(Rgba color, float alpha);

// Modality wins over label; both are matched case-insensitively.
// Unknown types get a stable palette slot derived from the type string.
Rgba color_for_node(const std::string& label, const std::string& modality);

} // namespace graph_util
