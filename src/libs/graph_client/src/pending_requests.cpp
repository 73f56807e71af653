#include <graph_client/pending_requests.hpp>
#include <utility>

namespace graph_client {

RequestId PendingRequests::add(HttpTransport::Completion completion) {
    std::lock_guard<std::mutex> lock(mutex_);
    const RequestId id = next_id_++;
    entries_.emplace(id, Entry{std::move(completion), {}});
    return id;
}

void PendingRequests::set_abort(RequestId id, Abort abort) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it != entries_.end()) it->second.abort = std::move(abort);
}

HttpTransport::Completion PendingRequests::take(RequestId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return {};
    HttpTransport::Completion c = std::move(it->second.completion);
    entries_.erase(it);
    return c;
}

bool PendingRequests::cancel(RequestId id) {
    Abort abort;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) return false;
        abort = std::move(it->second.abort);
        entries_.erase(it);
    }
    if (abort) abort();
    return true;
}

void PendingRequests::clear() {
    std::unordered_map<RequestId, Entry> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dropped.swap(entries_);
    }
    for (auto& [id, entry] : dropped) {
        if (entry.abort) entry.abort();
    }
}

size_t PendingRequests::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace graph_client
