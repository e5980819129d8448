#include "diagnostics.hpp"

void TerminalDiagnostics::log(const std::string& msg) {
    entries_.push_back(msg);
    if (mirror_) mirror_(msg);
}

std::string TerminalDiagnostics::get_log() const {
    std::string out;
    for (const auto& entry : entries_) {
        out += entry;
        out += '\n';
    }
    return out;
}

void TerminalDiagnostics::reset_log() {
    entries_.clear();
}
