#include "echo_queue.hpp"

void EchoQueue::record(char ch) {
    pending_.push_back(ch);
}

std::optional<char> EchoQueue::consume_front() {
    if (pending_.empty()) return std::nullopt;
    char ch = pending_.front();
    pending_.pop_front();
    return ch;
}

void EchoQueue::clear() {
    pending_.clear();
}
