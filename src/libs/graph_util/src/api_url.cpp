#include <graph_util/api_url.hpp>
#include <cctype>

namespace graph_util {

namespace {

bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

} // namespace

std::string url_encode_component(const std::string& value) {
    static const char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '*' || c == '-' || c == '.' || c == '_') {
            out += static_cast<char>(c);
        } else if (c == ' ') {
            out += '+';
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

void QueryParams::set(const std::string& key, const std::string& value) {
    bool replaced = false;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->first == key) {
            if (!replaced) {
                it->second = value;
                replaced = true;
                ++it;
            } else {
                it = entries_.erase(it);
            }
        } else {
            ++it;
        }
    }
    if (!replaced) entries_.emplace_back(key, value);
}

void QueryParams::append(const std::string& key, const std::string& value) {
    entries_.emplace_back(key, value);
}

std::string QueryParams::to_string() const {
    std::string out;
    for (const auto& [key, value] : entries_) {
        if (!out.empty()) out += '&';
        out += url_encode_component(key);
        out += '=';
        out += url_encode_component(value);
    }
    return out;
}

std::string resolve_api_url(const std::string& api_base,
    const std::string& endpoint_path,
    const QueryParams& query)
{
    std::string url;
    if (starts_with(endpoint_path, "http://") || starts_with(endpoint_path, "https://") || api_base.empty()) {
        url = endpoint_path;
    } else {
        std::string base = api_base;
        while (!base.empty() && base.back() == '/') base.pop_back();
        std::size_t start = 0;
        while (start < endpoint_path.size() && endpoint_path[start] == '/') ++start;
        url = base + "/" + endpoint_path.substr(start);
    }
    if (!query.empty()) {
        url += url.find('?') == std::string::npos ? '?' : '&';
        url += query.to_string();
    }
    return url;
}

} // namespace graph_util
