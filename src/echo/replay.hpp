#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include <core/types.hpp>

// Replay: drive LocalEcho from a scripted session so a reported mismatch can
// be reproduced offline.
//
// Script format (YAML):
//
//     events:
//       - keys: "ls"          # one echo() call per byte
//       - input: "\e[A"       # one echo() call with the whole string (paste)
//       - output: "ls\r\n"    # one write() call
//       - pause: 300          # LocalEcho::pause(300)
//       - advance: 300        # move the replay clock forward (ms)
//       - clear: true         # LocalEcho::clear()

enum class ReplayEventType {
    KEYS,
    INPUT,
    OUTPUT,
    PAUSE,
    ADVANCE,
    CLEAR,
};

struct ReplayEvent {
    ReplayEventType type = ReplayEventType::OUTPUT;
    std::string text;       // KEYS, INPUT, OUTPUT
    int ms = 0;             // PAUSE, ADVANCE
};

struct ReplayScript {
    std::vector<ReplayEvent> events;

    static Result<ReplayScript> parse(const std::string& yaml_text);
    static Result<ReplayScript> load(const std::filesystem::path& path);
};

struct ReplayReport {
    std::vector<std::string> writes;   // every writer call, in order
    std::string display;               // writes concatenated
    size_t pending = 0;                // queue depth after the last event
    std::vector<std::string> diagnostics;
};

ReplayReport run_replay(const ReplayScript& script);

// Human-readable summary of a report for the CLI.
std::string format_report(const ReplayReport& report);
