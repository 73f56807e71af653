#include <graph_client/snapshot_client.hpp>
#include <graph_loaders/snapshot_json.hpp>
#include <graph_util/log.hpp>
#include <chrono>
#include <mutex>
#include <utility>
#include <vector>

namespace graph_client {

struct SnapshotClient::Inbox {
    std::mutex mutex;
    std::vector<std::pair<std::uint64_t, TransportResponse>> items;
};

namespace {

std::int64_t system_now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string network_message(const std::string& target, const std::string& detail) {
    const std::string reason = detail.empty() ? std::string("connection failed") : detail;
    return "Could not reach " + target + " (" + reason + "). "
        "Confirm the backend is running and reachable from this machine.";
}

} // namespace

SnapshotClient::SnapshotClient(HttpTransport& transport, Clock clock)
    : transport_(transport)
    , clock_(std::move(clock))
    , inbox_(std::make_shared<Inbox>())
{
}

SnapshotClient::~SnapshotClient() {
    if (active_id_) transport_.cancel(*active_id_);
}

std::int64_t SnapshotClient::now() const {
    return clock_ ? clock_() : system_now_ms();
}

void SnapshotClient::fetch(const RequestConfig& config) {
    abort_current();

    last_config_ = config;
    RequestInfo info;
    info.generation = ++generation_;
    info.target = build_request_target(config);
    info.status = RequestStatus::Pending;
    info.started_at_ms = now();
    current_ = info;
    graph_util::logger()->info("Snapshot request #{} -> {}", info.generation, info.target);
    if (on_request_) on_request_(*current_);

    TransportOptions options;
    options.timeout_seconds = config.timeout_seconds;
    std::weak_ptr<Inbox> weak = inbox_;
    const std::uint64_t generation = info.generation;
    const RequestId id = transport_.get(info.target, options, [weak, generation](TransportResponse response) {
        auto inbox = weak.lock();
        if (!inbox) return;
        std::lock_guard<std::mutex> lock(inbox->mutex);
        inbox->items.emplace_back(generation, std::move(response));
    });
    // A synchronous transport may already have completed the request.
    if (pending()) active_id_ = id;
}

bool SnapshotClient::refresh() {
    if (!last_config_) return false;
    RequestConfig config = *last_config_;
    ++config.refresh_key;
    fetch(config);
    return true;
}

void SnapshotClient::cancel() {
    abort_current();
}

void SnapshotClient::abort_current() {
    if (active_id_) {
        transport_.cancel(*active_id_);
        active_id_.reset();
    }
    if (!pending()) return;
    RequestInfo info = *current_;
    info.status = RequestStatus::Aborted;
    info.error_kind = ErrorKind::Aborted;
    info.error_message = "Request aborted";
    info.completed_at_ms = now();
    info.duration_ms = *info.completed_at_ms - info.started_at_ms;
    graph_util::logger()->info("Snapshot request #{} aborted", info.generation);
    finish(std::move(info));
}

void SnapshotClient::finish(RequestInfo info) {
    current_ = info;
    history_.push_back(std::move(info));
    while (history_.size() > history_limit) history_.pop_front();
}

std::size_t SnapshotClient::poll() {
    std::vector<std::pair<std::uint64_t, TransportResponse>> items;
    {
        std::lock_guard<std::mutex> lock(inbox_->mutex);
        items.swap(inbox_->items);
    }
    std::size_t applied = 0;
    for (auto& [generation, response] : items) {
        if (!pending() || generation != current_->generation) {
            graph_util::logger()->debug("Dropping late response for request #{}", generation);
            continue;
        }
        apply(std::move(response));
        ++applied;
    }
    return applied;
}

void SnapshotClient::apply(TransportResponse response) {
    active_id_.reset();
    RequestInfo info = *current_;
    info.completed_at_ms = now();
    info.duration_ms = *info.completed_at_ms - info.started_at_ms;

    if (response.error == TransportError::Aborted) {
        info.status = RequestStatus::Aborted;
        info.error_kind = ErrorKind::Aborted;
        info.error_message = "Request aborted";
        finish(std::move(info));
        return;
    }

    std::shared_ptr<const graph_model::Snapshot> snapshot;
    switch (response.error) {
    case TransportError::Network:
        info.error_kind = ErrorKind::Network;
        info.error_message = network_message(info.target, response.error_message);
        break;
    case TransportError::Timeout:
        info.error_kind = ErrorKind::Timeout;
        info.error_message = "Snapshot request timed out"
            + (response.error_message.empty() ? std::string() : " (" + response.error_message + ")");
        break;
    case TransportError::Other:
        info.error_kind = ErrorKind::Unknown;
        info.error_message = response.error_message.empty() ? std::string("Unknown graph error") : response.error_message;
        break;
    case TransportError::None:
    case TransportError::Aborted:
        info.http_status = response.status_code;
        if (response.status_code < 200 || response.status_code >= 300) {
            info.error_kind = ErrorKind::Http;
            info.error_message = "Snapshot request failed (" + std::to_string(response.status_code) + ")";
            break;
        }
        {
            std::string parse_error;
            auto decoded = graph_loaders::parse_snapshot_json(response.body, &parse_error);
            if (!decoded) {
                info.error_kind = ErrorKind::Unknown;
                info.error_message = "Invalid snapshot payload: " + parse_error;
                break;
            }
            snapshot = std::make_shared<const graph_model::Snapshot>(std::move(*decoded));
        }
        break;
    }

    if (snapshot) {
        info.status = RequestStatus::Success;
        graph_util::logger()->info("Snapshot request #{} ok: {} nodes, {} edges in {}ms",
            info.generation, snapshot->nodes.size(), snapshot->edges.size(), *info.duration_ms);
    } else {
        info.status = RequestStatus::Error;
        graph_util::logger()->warn("Snapshot request #{} failed [{}]: {}",
            info.generation, error_kind_name(*info.error_kind), info.error_message);
    }
    finish(info);
    if (on_request_) on_request_(info);
    if (snapshot && on_snapshot_) on_snapshot_(std::move(snapshot));
}

} // namespace graph_client
