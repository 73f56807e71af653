#include <animation/point_animator.hpp>
#include <algorithm>
#include <cmath>
#include <utility>

namespace animation {

PointAnimator::PointAnimator() = default;

void PointAnimator::set_targets(const graph_layout::LayoutMap& targets) {
    target_ = targets;
    graph_layout::LayoutMap next;
    next.reserve(targets.size());
    for (const auto& [id, p] : targets) {
        auto it = current_.find(id);
        next[id] = it == current_.end() ? p : it->second;
    }
    current_ = std::move(next);
    settled_ = false;
}

void PointAnimator::snap_to_targets() {
    current_ = target_;
    settled_ = true;
}

static double ease_out(double t) {
    if (t >= 1.0) return 1.0;
    return 1.0 - (1.0 - t) * (1.0 - t);
}

void PointAnimator::tick(float dt) {
    if (settled_ || dt <= 0.f) return;
    double step = static_cast<double>(dt) / static_cast<double>(duration_);
    step = std::min(1.0, step);
    step = ease_out(step);
    bool all_settled = true;
    for (auto& [id, cur] : current_) {
        const graph_layout::Point& target = target_[id];
        cur.x += (target.x - cur.x) * step;
        cur.y += (target.y - cur.y) * step;
        const double eps = 0.5;
        if (std::abs(cur.x - target.x) < eps && std::abs(cur.y - target.y) < eps)
            cur = target;
        else
            all_settled = false;
    }
    settled_ = all_settled;
}

graph_layout::Point PointAnimator::get_current(const std::string& id) const {
    auto it = current_.find(id);
    if (it == current_.end()) return {};
    return it->second;
}

} // namespace animation
