#pragma once

#include <chrono>
#include <functional>
#include <optional>

// PauseGate: suppresses local echo until a deadline passes.
//
// Expiry is checked lazily on every paused() call; there is no timer.
// Uses a monotonic clock so wall-clock adjustments cannot stretch or
// cut short a pause. The clock is injectable for tests.
class PauseGate {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;

    PauseGate();
    explicit PauseGate(NowFn now);

    // Suppress until now + duration. Re-arming replaces any earlier deadline.
    void pause(std::chrono::milliseconds duration);

    // True while the deadline is in the future. Once it has passed the
    // deadline is dropped and this returns false until pause() is called again.
    bool paused();

    bool armed() const { return deadline_.has_value(); }

private:
    NowFn now_;
    std::optional<Clock::time_point> deadline_;
};
