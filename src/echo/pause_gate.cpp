#include "pause_gate.hpp"

PauseGate::PauseGate() : now_([] { return Clock::now(); }) {}

PauseGate::PauseGate(NowFn now) : now_(std::move(now)) {}

void PauseGate::pause(std::chrono::milliseconds duration) {
    deadline_ = now_() + duration;
}

bool PauseGate::paused() {
    if (!deadline_) return false;

    if (now_() < *deadline_) return true;

    deadline_.reset();
    return false;
}
