#pragma once

namespace animation {

// One-shot countdown driven by frame ticks.
class Countdown {
public:
    void start(float seconds);
    void cancel();
    // Returns true on the tick that reaches zero.
    bool tick(float dt);

    bool active() const { return active_; }
    float remaining() const { return remaining_; }
    float duration() const { return duration_; }
    // 1 right after start, falling linearly to 0 at expiry; 0 when inactive.
    float fraction_remaining() const;

private:
    float duration_ = 0.f;
    float remaining_ = 0.f;
    bool active_ = false;
};

// Fires every interval seconds while running. Large dt values fire once per tick
// and carry the remainder, so a stalled frame never produces a burst of steps.
class IntervalTimer {
public:
    explicit IntervalTimer(float interval_seconds = 1.0f) : interval_(interval_seconds) {}

    void set_interval(float seconds) { interval_ = seconds; }
    float interval() const { return interval_; }

    void start();
    void stop();
    bool running() const { return running_; }
    bool tick(float dt);

private:
    float interval_;
    float elapsed_ = 0.f;
    bool running_ = false;
};

} // namespace animation
