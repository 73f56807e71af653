#include <animation/timers.hpp>
#include <algorithm>

namespace animation {

void Countdown::start(float seconds) {
    duration_ = seconds;
    remaining_ = seconds;
    active_ = true;
}

void Countdown::cancel() {
    active_ = false;
    remaining_ = 0.f;
}

bool Countdown::tick(float dt) {
    if (!active_ || dt <= 0.f) return false;
    remaining_ -= dt;
    if (remaining_ > 0.f) return false;
    remaining_ = 0.f;
    active_ = false;
    return true;
}

float Countdown::fraction_remaining() const {
    if (!active_ || duration_ <= 0.f) return 0.f;
    return std::clamp(remaining_ / duration_, 0.f, 1.f);
}

void IntervalTimer::start() {
    running_ = true;
    elapsed_ = 0.f;
}

void IntervalTimer::stop() {
    running_ = false;
    elapsed_ = 0.f;
}

bool IntervalTimer::tick(float dt) {
    if (!running_ || dt <= 0.f || interval_ <= 0.f) return false;
    elapsed_ += dt;
    if (elapsed_ < interval_) return false;
    elapsed_ = std::min(elapsed_ - interval_, interval_ * 0.5f);
    return true;
}

} // namespace animation
