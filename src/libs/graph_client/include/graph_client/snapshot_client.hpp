#pragma once

#include <graph_client/http_transport.hpp>
#include <graph_client/request_config.hpp>
#include <graph_client/request_info.hpp>
#include <graph_model/types.hpp>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace graph_client {

// Fetches snapshots with at most one request in flight. A new fetch aborts the
// previous one; late responses from superseded generations are discarded.
// Responses are queued by the transport thread and delivered by poll() on the
// caller's thread, so callbacks never run concurrently with the UI.
class SnapshotClient {
public:
    using SnapshotCallback = std::function<void(std::shared_ptr<const graph_model::Snapshot>)>;
    using RequestCallback = std::function<void(const RequestInfo&)>;
    using Clock = std::function<std::int64_t()>; // epoch milliseconds

    static constexpr std::size_t history_limit = 16;

    explicit SnapshotClient(HttpTransport& transport, Clock clock = {});
    ~SnapshotClient();
    SnapshotClient(const SnapshotClient&) = delete;
    SnapshotClient& operator=(const SnapshotClient&) = delete;

    void set_on_snapshot(SnapshotCallback cb) { on_snapshot_ = std::move(cb); }
    // Fired on pending, success and error transitions (never for aborts).
    void set_on_request(RequestCallback cb) { on_request_ = std::move(cb); }

    void fetch(const RequestConfig& config);
    // Bumps refresh_key and re-issues the last config. Returns false before the first fetch.
    bool refresh();
    // Aborts the in-flight request, if any.
    void cancel();
    // Delivers queued responses; returns how many were applied.
    std::size_t poll();

    bool pending() const { return current_ && current_->status == RequestStatus::Pending; }
    const std::optional<RequestInfo>& current() const { return current_; }
    // Finished requests, oldest first.
    const std::deque<RequestInfo>& history() const { return history_; }
    const std::optional<RequestConfig>& last_config() const { return last_config_; }
    std::uint64_t generation() const { return generation_; }

private:
    struct Inbox;

    void abort_current();
    void finish(RequestInfo info);
    void apply(TransportResponse response);
    std::int64_t now() const;

    HttpTransport& transport_;
    Clock clock_;
    std::shared_ptr<Inbox> inbox_;
    std::optional<RequestInfo> current_;
    std::optional<RequestId> active_id_;
    std::optional<RequestConfig> last_config_;
    std::deque<RequestInfo> history_;
    std::uint64_t generation_ = 0;
    SnapshotCallback on_snapshot_;
    RequestCallback on_request_;
};

} // namespace graph_client
