#pragma once

#include <functional>
#include <string>
#include <vector>

// TerminalDiagnostics: append-only record of local-echo mismatches.
//
// Written by LocalEcho when remote output cannot be reconciled, read only by
// whoever is debugging the session. Survives LocalEcho::clear(); only
// reset_log() empties it.
class TerminalDiagnostics {
public:
    using Mirror = std::function<void(const std::string&)>;

    void log(const std::string& msg);

    // All entries, newline separated.
    std::string get_log() const;
    void reset_log();

    const std::vector<std::string>& entries() const { return entries_; }
    bool empty() const { return entries_.empty(); }

    // Also forward every entry here as it is logged (e.g. the debug log file).
    void set_mirror(Mirror mirror) { mirror_ = std::move(mirror); }

private:
    std::vector<std::string> entries_;
    Mirror mirror_;
};
