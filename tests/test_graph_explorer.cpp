#include <explorer/graph_explorer.hpp>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using explorer::ExplorerConfig;
using explorer::GraphExplorer;
using graph_client::RequestInfo;
using graph_client::RequestStatus;
using graph_client::TransportResponse;

namespace {

// Records requests; responses are scripted by the test. Cancelled requests
// never complete, as with a real transport.
class ScriptedTransport : public graph_client::HttpTransport {
public:
    struct Request {
        graph_client::RequestId id = 0;
        std::string url;
        Completion completion;
        bool cancelled = false;
    };

    graph_client::RequestId get(const std::string& url, const graph_client::TransportOptions&,
        Completion completion) override
    {
        Request r;
        r.id = ++next_id_;
        r.url = url;
        r.completion = std::move(completion);
        requests.push_back(std::move(r));
        return requests.back().id;
    }

    void cancel(graph_client::RequestId id) override {
        for (auto& r : requests) {
            if (r.id == id) r.cancelled = true;
        }
    }

    void respond(std::size_t index, TransportResponse response) {
        Request& r = requests.at(index);
        ASSERT_FALSE(r.cancelled) << "request " << index << " was cancelled";
        r.completion(std::move(response));
    }

    void respond_ok(std::size_t index, const std::string& body) {
        TransportResponse r;
        r.status_code = 200;
        r.body = body;
        respond(index, std::move(r));
    }

    std::vector<Request> requests;

private:
    graph_client::RequestId next_id_ = 0;
};

std::string payload(const std::string& generated_at, const std::vector<std::string>& ids, bool with_time_range = false) {
    std::string nodes;
    for (const auto& id : ids) {
        if (!nodes.empty()) nodes += ", ";
        nodes += R"({"id": ")" + id + R"(", "label": "Doc", "modality": "doc"})";
    }
    std::string text = R"({"generatedAt": ")" + generated_at + R"(", "nodes": [)" + nodes + "]";
    if (with_time_range) {
        text += R"(, "meta": {"modalityCounts": {"doc": 1},
            "minTimestamp": "2024-05-01T00:00:00Z", "maxTimestamp": "2024-06-01T00:00:00Z"})";
    }
    return text + "}";
}

ExplorerConfig online_config() {
    ExplorerConfig c;
    c.api_base = "http://localhost:8000";
    c.limit = 100;
    return c;
}

struct ExplorerHarness {
    ScriptedTransport transport;
    GraphExplorer explorer{online_config(), &transport};
    std::vector<RequestInfo> requests;
    int layouts = 0;

    ExplorerHarness() {
        explorer::DiagnosticsPort port;
        port.on_request = [this](const RequestInfo& info) { requests.push_back(info); };
        port.on_layout = [this](const graph_layout::LayoutMap&, graph_layout::LayoutStrategy) { ++layouts; };
        explorer.set_diagnostics_port(std::move(port));
        explorer.start();
    }

    void frame() { explorer.update(1.0f / 60.0f); }
};

} // namespace

TEST(GraphExplorer, FirstSnapshotBuildsGraphWithoutHighlight) {
    ExplorerHarness h;
    ASSERT_EQ(h.transport.requests.size(), 1u);
    EXPECT_NE(h.transport.requests[0].url.find("limit=100"), std::string::npos);

    h.transport.respond_ok(0, payload("2024-06-01T12:00:00Z", {"a", "b"}));
    EXPECT_EQ(h.explorer.snapshot(), nullptr);
    h.frame();

    ASSERT_NE(h.explorer.snapshot(), nullptr);
    ASSERT_NE(h.explorer.graph(), nullptr);
    EXPECT_EQ(h.explorer.graph()->nodes().size(), 2u);
    EXPECT_EQ(h.explorer.layout_cache().layout().size(), 2u);
    EXPECT_TRUE(h.explorer.highlights().highlight().empty());
    EXPECT_FALSE(h.explorer.error().has_value());
    EXPECT_EQ(h.layouts, 1);
}

TEST(GraphExplorer, SecondSnapshotHighlightsOnlyNewNodes) {
    ExplorerHarness h;
    h.transport.respond_ok(0, payload("2024-06-01T12:00:00Z", {"a", "b"}));
    h.frame();

    h.explorer.refresh();
    ASSERT_EQ(h.transport.requests.size(), 2u);
    h.transport.respond_ok(1, payload("2024-06-01T12:05:00Z", {"a", "b", "c"}));
    h.frame();

    const auto& highlight = h.explorer.highlights().highlight();
    EXPECT_EQ(highlight.nodes.size(), 1u);
    EXPECT_TRUE(highlight.has_node("c"));
    EXPECT_GT(h.explorer.highlights().fade(), 0.0f);
}

TEST(GraphExplorer, SameNodeSetKeepsLayout) {
    ExplorerHarness h;
    h.transport.respond_ok(0, payload("2024-06-01T12:00:00Z", {"a", "b", "c"}));
    h.frame();
    const auto version = h.explorer.layout_cache().version();
    const auto positions = h.explorer.layout_cache().layout();

    h.explorer.refresh();
    h.transport.respond_ok(1, payload("2024-06-01T12:05:00Z", {"c", "a", "b"}));
    h.frame();

    EXPECT_EQ(h.explorer.snapshot()->generated_at, "2024-06-01T12:05:00Z");
    EXPECT_EQ(h.explorer.layout_cache().version(), version);
    for (const auto& [id, p] : positions) {
        const auto& now = h.explorer.layout_cache().layout().at(id);
        EXPECT_DOUBLE_EQ(now.x, p.x);
        EXPECT_DOUBLE_EQ(now.y, p.y);
    }
}

TEST(GraphExplorer, OlderSnapshotIsIgnored) {
    ExplorerHarness h;
    h.transport.respond_ok(0, payload("2024-06-01T12:05:00Z", {"a", "b"}));
    h.frame();

    h.explorer.refresh();
    h.transport.respond_ok(1, payload("2024-06-01T12:00:00Z", {"a", "b", "c"}));
    h.frame();

    ASSERT_NE(h.explorer.snapshot(), nullptr);
    EXPECT_EQ(h.explorer.snapshot()->generated_at, "2024-06-01T12:05:00Z");
    EXPECT_EQ(h.explorer.graph()->nodes().size(), 2u);
    EXPECT_TRUE(h.explorer.highlights().highlight().empty());
    EXPECT_EQ(h.layouts, 1);
}

TEST(GraphExplorer, ErrorClearsSnapshotAndReportsRequest) {
    ExplorerHarness h;
    h.transport.respond_ok(0, payload("2024-06-01T12:00:00Z", {"a", "b"}));
    h.frame();
    ASSERT_NE(h.explorer.snapshot(), nullptr);

    h.explorer.refresh();
    TransportResponse failed;
    failed.status_code = 503;
    failed.body = "upstream down";
    h.transport.respond(1, failed);
    h.frame();

    EXPECT_EQ(h.explorer.snapshot(), nullptr);
    EXPECT_EQ(h.explorer.graph(), nullptr);
    EXPECT_TRUE(h.explorer.layout_cache().layout().empty());
    ASSERT_TRUE(h.explorer.error().has_value());
    EXPECT_EQ(*h.explorer.error(), "Snapshot request failed (503)");

    ASSERT_FALSE(h.requests.empty());
    const RequestInfo& last = h.requests.back();
    EXPECT_EQ(last.status, RequestStatus::Error);
    EXPECT_EQ(last.http_status.value_or(0), 503);
    EXPECT_EQ(last.target, h.transport.requests[1].url);
    ASSERT_NE(h.explorer.client(), nullptr);
    EXPECT_EQ(h.explorer.client()->current()->status, RequestStatus::Error);

    // The next request clears the error again.
    h.explorer.refresh();
    EXPECT_FALSE(h.explorer.error().has_value());
    EXPECT_EQ(h.requests.back().status, RequestStatus::Pending);
}

TEST(GraphExplorer, FilterChangeRefetchesAndAbortsPrevious) {
    ExplorerHarness h;
    ASSERT_EQ(h.transport.requests.size(), 1u);

    EXPECT_TRUE(h.explorer.filters().set_limit(200));
    ASSERT_EQ(h.transport.requests.size(), 2u);
    EXPECT_TRUE(h.transport.requests[0].cancelled);
    EXPECT_NE(h.transport.requests[1].url.find("limit=200"), std::string::npos);
    ASSERT_FALSE(h.explorer.client()->history().empty());
    EXPECT_EQ(h.explorer.client()->history().back().status, RequestStatus::Aborted);

    h.explorer.filters().toggle_modality("doc");
    ASSERT_EQ(h.transport.requests.size(), 3u);
    EXPECT_TRUE(h.transport.requests[1].cancelled);
    EXPECT_NE(h.transport.requests[2].url.find("modalities=doc"), std::string::npos);

    // Unchanged limit issues nothing.
    EXPECT_FALSE(h.explorer.filters().set_limit(200));
    EXPECT_EQ(h.transport.requests.size(), 3u);

    h.transport.respond_ok(2, payload("2024-06-01T12:00:00Z", {"a"}));
    h.frame();
    ASSERT_NE(h.explorer.snapshot(), nullptr);
    EXPECT_EQ(h.explorer.request_config().filters.limit, 200);
}

TEST(GraphExplorer, RefreshStopsReplayAndRefetches) {
    ExplorerHarness h;
    h.transport.respond_ok(0, payload("2024-06-01T12:00:00Z", {"a", "b"}, true));
    h.frame();
    ASSERT_TRUE(h.explorer.filters().time_bounds().has_value());

    ASSERT_TRUE(h.explorer.filters().start_replay());
    EXPECT_TRUE(h.explorer.filters().replaying());

    h.explorer.refresh();
    EXPECT_FALSE(h.explorer.filters().replaying());
    ASSERT_EQ(h.transport.requests.size(), 2u);
    EXPECT_EQ(h.explorer.request_config().refresh_key, 1);
    EXPECT_TRUE(h.explorer.client()->pending());

    // Further frames no longer step the replay.
    for (int i = 0; i < 200; ++i) h.frame();
    EXPECT_EQ(h.transport.requests.size(), 2u);
}

TEST(GraphExplorer, ReplayStepRequestsEarlierSnapshot) {
    ExplorerHarness h;
    h.transport.respond_ok(0, payload("2024-06-01T12:00:00Z", {"a", "b"}, true));
    h.frame();
    ASSERT_TRUE(h.explorer.filters().start_replay());

    for (int i = 0; i < 90 && h.transport.requests.size() < 2; ++i) h.frame();
    ASSERT_EQ(h.transport.requests.size(), 2u);
    EXPECT_NE(h.transport.requests[1].url.find("snapshotAt="), std::string::npos);
}

TEST(GraphExplorer, OfflineShowsHandedSnapshot) {
    GraphExplorer explorer(ExplorerConfig{}, nullptr);
    EXPECT_TRUE(explorer.offline());
    explorer.start();
    explorer.refresh();
    EXPECT_EQ(explorer.client(), nullptr);

    graph_model::Snapshot s;
    s.generated_at = "2024-06-01T12:00:00Z";
    graph_model::GraphNode n;
    n.id = "a";
    n.label = "Doc";
    s.nodes.push_back(n);
    explorer.show_snapshot(std::make_shared<const graph_model::Snapshot>(std::move(s)));
    ASSERT_NE(explorer.graph(), nullptr);
    EXPECT_EQ(explorer.layout_cache().layout().size(), 1u);
}
