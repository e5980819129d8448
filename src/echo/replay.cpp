#include "replay.hpp"
#include "ansi.hpp"
#include "local_echo.hpp"
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <iterator>

static Result<ReplayEvent> parse_event(const YAML::Node& node, size_t index) {
    if (!node.IsMap() || node.size() != 1) {
        return Result<ReplayEvent>::Err(
            fmt::format("event {}: expected a single-key map", index + 1));
    }

    auto kv = *node.begin();
    std::string key = kv.first.as<std::string>();
    const YAML::Node& value = kv.second;

    ReplayEvent ev;
    if (key == "keys" || key == "input" || key == "output") {
        if (!value.IsScalar()) {
            return Result<ReplayEvent>::Err(
                fmt::format("event {}: '{}' needs a string", index + 1, key));
        }
        ev.type = key == "keys"  ? ReplayEventType::KEYS
                : key == "input" ? ReplayEventType::INPUT
                                 : ReplayEventType::OUTPUT;
        ev.text = value.as<std::string>();
    } else if (key == "pause" || key == "advance") {
        if (!value.IsScalar()) {
            return Result<ReplayEvent>::Err(
                fmt::format("event {}: '{}' needs milliseconds", index + 1, key));
        }
        ev.type = key == "pause" ? ReplayEventType::PAUSE : ReplayEventType::ADVANCE;
        ev.ms = value.as<int>(-1);
        if (ev.ms < 0) {
            return Result<ReplayEvent>::Err(
                fmt::format("event {}: '{}' must be a non-negative integer", index + 1, key));
        }
    } else if (key == "clear") {
        if (!value.IsScalar() || !value.as<bool>(false)) {
            return Result<ReplayEvent>::Err(
                fmt::format("event {}: 'clear' takes only 'true'", index + 1));
        }
        ev.type = ReplayEventType::CLEAR;
    } else {
        return Result<ReplayEvent>::Err(
            fmt::format("event {}: unknown event '{}'", index + 1, key));
    }
    return Result<ReplayEvent>::Ok(ev);
}

Result<ReplayScript> ReplayScript::parse(const std::string& yaml_text) {
    try {
        const YAML::Node root = YAML::Load(yaml_text);
        if (!root.IsMap() || !root["events"] || !root["events"].IsSequence()) {
            return Result<ReplayScript>::Err("Replay script needs an 'events' list");
        }

        ReplayScript script;
        const YAML::Node events = root["events"];
        for (size_t i = 0; i < events.size(); i++) {
            auto ev = parse_event(events[i], i);
            if (ev.is_err()) {
                return Result<ReplayScript>::Err(ev.error);
            }
            script.events.push_back(ev.value);
        }
        return Result<ReplayScript>::Ok(script);
    } catch (const YAML::Exception& e) {
        return Result<ReplayScript>::Err(std::string("Failed to parse replay script: ") + e.what());
    }
}

Result<ReplayScript> ReplayScript::load(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<ReplayScript>::Err("Cannot open replay script: " + path.string());
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return parse(text);
}

ReplayReport run_replay(const ReplayScript& script) {
    ReplayReport report;
    auto now = PauseGate::Clock::time_point{};

    LocalEcho echo(
        [&report](const std::string& s) {
            report.writes.push_back(s);
            report.display += s;
        },
        [&now] { return now; });

    for (const auto& ev : script.events) {
        switch (ev.type) {
            case ReplayEventType::KEYS:
                for (char c : ev.text) echo.echo(std::string(1, c));
                break;
            case ReplayEventType::INPUT:
                echo.echo(ev.text);
                break;
            case ReplayEventType::OUTPUT:
                echo.write(ev.text);
                break;
            case ReplayEventType::PAUSE:
                echo.pause(ev.ms);
                break;
            case ReplayEventType::ADVANCE:
                now += std::chrono::milliseconds(ev.ms);
                break;
            case ReplayEventType::CLEAR:
                echo.clear();
                break;
        }
    }

    report.pending = echo.pending();
    report.diagnostics = echo.diagnostics().entries();
    return report;
}

std::string format_report(const ReplayReport& report) {
    std::string out;
    out += fmt::format("writes ({}):\n", report.writes.size());
    for (size_t i = 0; i < report.writes.size(); i++) {
        out += fmt::format("  {:>3}  '{}'\n", i + 1, ansi::pretty_print(report.writes[i]));
    }
    out += fmt::format("display: '{}'\n", ansi::pretty_print(report.display));
    out += fmt::format("text:    '{}'\n", ansi::strip(report.display));
    out += fmt::format("pending: {}\n", report.pending);
    out += fmt::format("mismatches ({}):\n", report.diagnostics.size());
    for (const auto& d : report.diagnostics) {
        out += "  " + d + "\n";
    }
    return out;
}
