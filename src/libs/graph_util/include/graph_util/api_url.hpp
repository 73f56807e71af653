#pragma once

#include <string>
#include <utility>
#include <vector>

namespace graph_util {

// application/x-www-form-urlencoded component encoding: unreserved characters
// (A-Z a-z 0-9 * - . _) pass through, space becomes '+', everything else %XX.
std::string url_encode_component(const std::string& value);

// Ordered query builder. Keys may repeat (append) or be unique (set replaces in place).
class QueryParams {
public:
    void set(const std::string& key, const std::string& value);
    void append(const std::string& key, const std::string& value);
    bool empty() const { return entries_.empty(); }
    const std::vector<std::pair<std::string, std::string>>& entries() const { return entries_; }
    std::string to_string() const;

private:
    std::vector<std::pair<std::string, std::string>> entries_;
};

// Absolute endpoint paths (http:// or https://) ignore api_base.
std::string resolve_api_url(const std::string& api_base,
    const std::string& endpoint_path,
    const QueryParams& query);

} // namespace graph_util
