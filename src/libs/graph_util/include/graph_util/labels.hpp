#pragma once

#include <cstddef>
#include <string>

namespace graph_util {

// "slack_event" -> "Slack event", "apiEndpoint" -> "Api Endpoint".
std::string humanize_label(const std::string& label);

// Cuts to max_chars and appends "..." when longer.
std::string truncate_label(const std::string& text, std::size_t max_chars);

} // namespace graph_util
