#pragma once

#include <cstddef>
#include <deque>
#include <optional>

// EchoQueue: characters drawn locally that the remote has not confirmed yet,
// in the order they were drawn.
//
// Only successful local echo appends; only reconciliation or clear() removes.
// Not thread-safe: keystroke admission and output reconciliation must run on
// the same dispatch thread.
class EchoQueue {
public:
    void record(char ch);

    // Pop the oldest character. nullopt when nothing is pending.
    std::optional<char> consume_front();

    bool empty() const { return pending_.empty(); }
    size_t size() const { return pending_.size(); }
    void clear();

private:
    std::deque<char> pending_;
};
