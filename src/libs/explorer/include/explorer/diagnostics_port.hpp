#pragma once

#include <canvas/viewport.hpp>
#include <graph_client/request_info.hpp>
#include <graph_layout/types.hpp>
#include <functional>

namespace explorer {

// Optional observer hooks for hosts and tests. Unset members are skipped.
struct DiagnosticsPort {
    std::function<void(const graph_layout::LayoutMap&, graph_layout::LayoutStrategy)> on_layout;
    std::function<void(const canvas::ViewState&)> on_view_state;
    std::function<void(const graph_client::RequestInfo&)> on_request;
};

} // namespace explorer
