#pragma once

#include <graph_client/http_transport.hpp>
#include <functional>
#include <mutex>
#include <unordered_map>

namespace graph_client {

// Thread-safe table of in-flight requests for transports whose completions
// arrive on a worker thread. Each entry pairs the caller's completion with an
// abort hook that stops the underlying socket work.
class PendingRequests {
public:
    using Abort = std::function<void()>;

    RequestId add(HttpTransport::Completion completion);
    void set_abort(RequestId id, Abort abort);

    // Removes the entry and returns its completion (empty if unknown or cancelled).
    HttpTransport::Completion take(RequestId id);

    // Removes the entry without delivering it and runs its abort hook.
    // Returns false when the id was no longer pending.
    bool cancel(RequestId id);

    void clear();
    size_t size() const;

private:
    struct Entry {
        HttpTransport::Completion completion;
        Abort abort;
    };

    mutable std::mutex mutex_;
    std::unordered_map<RequestId, Entry> entries_;
    RequestId next_id_ = 1;
};

} // namespace graph_client
