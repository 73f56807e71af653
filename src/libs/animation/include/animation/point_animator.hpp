#pragma once

#include <graph_layout/types.hpp>
#include <string>

namespace animation {

// Eases displayed node positions toward their layout targets after a relayout.
// Ids seen for the first time appear at their target directly.
class PointAnimator {
public:
    PointAnimator();
    void set_duration(float seconds) { duration_ = seconds; }
    float duration() const { return duration_; }

    // Replaces the target set; ids missing from targets are dropped.
    void set_targets(const graph_layout::LayoutMap& targets);
    void snap_to_targets();
    void tick(float dt);
    bool settled() const { return settled_; }

    graph_layout::Point get_current(const std::string& id) const;
    const graph_layout::LayoutMap& current() const { return current_; }

private:
    graph_layout::LayoutMap current_;
    graph_layout::LayoutMap target_;
    float duration_ = 0.25f;
    bool settled_ = true;
};

} // namespace animation
