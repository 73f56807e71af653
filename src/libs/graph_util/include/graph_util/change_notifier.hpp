#pragma once

#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

namespace graph_util {

// Multi-subscriber change notification. Subscribers may unsubscribe (or subscribe)
// from inside a callback; such changes take effect for the next notify().
template <typename... Args>
class ChangeNotifier {
public:
    using Callback = std::function<void(Args...)>;
    using SubscriptionId = std::size_t;

    SubscriptionId subscribe(Callback callback) {
        const SubscriptionId id = next_id_++;
        subscribers_.emplace_back(id, std::move(callback));
        return id;
    }

    void unsubscribe(SubscriptionId id) {
        for (auto it = subscribers_.begin(); it != subscribers_.end(); ++it) {
            if (it->first == id) {
                subscribers_.erase(it);
                return;
            }
        }
    }

    void notify(Args... args) const {
        const auto snapshot = subscribers_;
        for (const auto& entry : snapshot) {
            if (entry.second) entry.second(args...);
        }
    }

    std::size_t subscriber_count() const { return subscribers_.size(); }

private:
    std::vector<std::pair<SubscriptionId, Callback>> subscribers_;
    SubscriptionId next_id_ = 1;
};

} // namespace graph_util
