#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace graph_util {

// Shared application logger: stderr + logs/graph_explorer_latest.log under the project root.
// Falls back to spdlog's default logger when the sinks cannot be created.
std::shared_ptr<spdlog::logger> logger();

// Accepts spdlog level names ("trace", "debug", "info", "warn", "error", "critical", "off").
// An unknown name logs a warning, leaves the level unchanged and returns false.
bool set_log_level(const std::string& level_name);

} // namespace graph_util
