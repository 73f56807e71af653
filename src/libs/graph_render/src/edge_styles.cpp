#include <graph_render/edge_styles.hpp>
#include <cctype>
#include <unordered_map>

namespace graph_render {

namespace {

std::string normalize_type(const std::string& type) {
    std::size_t begin = 0;
    std::size_t end = type.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(type[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(type[end - 1]))) --end;
    std::string out = type.substr(begin, end - begin);
    for (auto& c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return out;
}

const std::unordered_map<std::string, EdgeStyle>& edge_style_table() {
    static const std::unordered_map<std::string, EdgeStyle> table = {
        {"ABOUT_COMPONENT", {{248, 113, 38, 0.65f}, 1.8f}},
        {"HAS_COMPONENT", {{14, 165, 233, 0.65f}, 1.7f}},
        {"DOC_DOCUMENTS_COMPONENT", {{190, 242, 100, 0.65f}, 1.6f}},
        {"DESCRIBES_COMPONENT", {{196, 181, 253, 0.6f}, 1.6f}},
        {"TOUCHES_COMPONENT", {{248, 250, 252, 0.45f}, 1.5f}},
        {"MODIFIES_COMPONENT", {{249, 115, 22, 0.7f}, 1.8f}},
        {"EXPOSES_ENDPOINT", {{56, 189, 248, 0.65f}, 1.6f}},
    };
    return table;
}

} // namespace

EdgeStyle default_edge_style() {
    return {{94, 109, 126, 0.6f}, 1.5f};
}

EdgeStyle edge_style_for(const std::string& type) {
    if (type.empty()) return default_edge_style();
    const auto& table = edge_style_table();
    auto it = table.find(normalize_type(type));
    return it == table.end() ? default_edge_style() : it->second;
}

} // namespace graph_render
