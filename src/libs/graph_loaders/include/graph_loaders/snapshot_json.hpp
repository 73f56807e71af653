#pragma once

#include <graph_model/types.hpp>
#include <istream>
#include <optional>
#include <string>

namespace graph_loaders {

// Decodes a snapshot payload ({generatedAt, nodes, edges, meta?}).
// Nodes without an id are skipped, edges with unknown endpoints are dropped.
// On failure returns nullopt and, when error is non-null, a short reason.
std::optional<graph_model::Snapshot> parse_snapshot_json(const std::string& text, std::string* error = nullptr);

std::optional<graph_model::Snapshot> load_snapshot_from_json(std::istream& in, std::string* error = nullptr);
std::optional<graph_model::Snapshot> load_snapshot_from_json_file(const std::string& path, std::string* error = nullptr);

// Built-in demo graph for offline runs.
graph_model::Snapshot generate_debug_snapshot();

} // namespace graph_loaders
