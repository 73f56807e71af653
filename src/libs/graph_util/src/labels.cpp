#include <graph_util/labels.hpp>
#include <cctype>

namespace graph_util {

std::string humanize_label(const std::string& label) {
    if (label.empty()) return label;
    std::string out;
    out.reserve(label.size() + 4);
    for (std::size_t i = 0; i < label.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(label[i]);
        if (c == '_') {
            out += ' ';
            continue;
        }
        if (i > 0 && std::isupper(c) && std::islower(static_cast<unsigned char>(label[i - 1])))
            out += ' ';
        out += static_cast<char>(c);
    }
    out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
    return out;
}

std::string truncate_label(const std::string& text, std::size_t max_chars) {
    if (text.size() <= max_chars) return text;
    return text.substr(0, max_chars) + "...";
}

} // namespace graph_util
