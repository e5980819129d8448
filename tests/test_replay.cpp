#include <gtest/gtest.h>
#include <echo/replay.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

static ReplayScript parse_ok(const std::string& yaml) {
    auto r = ReplayScript::parse(yaml);
    EXPECT_TRUE(r.is_ok()) << r.error;
    return r.value;
}

TEST(ReplayScript, ParsesAllEventKinds) {
    auto script = parse_ok(R"(
events:
  - keys: "ls"
  - input: "\e[A"
  - output: "ls\r\n"
  - pause: 300
  - advance: 150
  - clear: true
)");
    ASSERT_EQ(script.events.size(), 6u);
    EXPECT_EQ(script.events[0].type, ReplayEventType::KEYS);
    EXPECT_EQ(script.events[0].text, "ls");
    EXPECT_EQ(script.events[1].type, ReplayEventType::INPUT);
    EXPECT_EQ(script.events[1].text, "\x1b[A");
    EXPECT_EQ(script.events[2].type, ReplayEventType::OUTPUT);
    EXPECT_EQ(script.events[2].text, "ls\r\n");
    EXPECT_EQ(script.events[3].type, ReplayEventType::PAUSE);
    EXPECT_EQ(script.events[3].ms, 300);
    EXPECT_EQ(script.events[4].type, ReplayEventType::ADVANCE);
    EXPECT_EQ(script.events[4].ms, 150);
    EXPECT_EQ(script.events[5].type, ReplayEventType::CLEAR);
}

TEST(ReplayScript, MissingEventsList) {
    auto r = ReplayScript::parse("steps: []\n");
    EXPECT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("events"), std::string::npos);
}

TEST(ReplayScript, UnknownEventNamesItsPosition) {
    auto r = ReplayScript::parse("events:\n  - keys: a\n  - typo: b\n");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("event 2"), std::string::npos);
    EXPECT_NE(r.error.find("typo"), std::string::npos);
}

TEST(ReplayScript, NegativeDurationRejected) {
    EXPECT_TRUE(ReplayScript::parse("events:\n  - pause: -5\n").is_err());
    EXPECT_TRUE(ReplayScript::parse("events:\n  - advance: soon\n").is_err());
}

TEST(ReplayScript, ClearAcceptsOnlyTrue) {
    auto r = ReplayScript::parse("events:\n  - keys: a\n  - clear: false\n");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("event 2"), std::string::npos);
    EXPECT_TRUE(ReplayScript::parse("events:\n  - clear: later\n").is_err());
    EXPECT_TRUE(ReplayScript::parse("events:\n  - clear: [true]\n").is_err());
}

TEST(ReplayScript, DefaultEventIsOutput) {
    ReplayEvent ev;
    EXPECT_EQ(ev.type, ReplayEventType::OUTPUT);
    EXPECT_EQ(ev.ms, 0);
}

TEST(ReplayScript, EventMustBeSingleKeyMap) {
    EXPECT_TRUE(ReplayScript::parse("events:\n  - keys: a\n    output: a\n").is_err());
    EXPECT_TRUE(ReplayScript::parse("events:\n  - just text\n").is_err());
}

TEST(ReplayScript, MalformedYaml) {
    auto r = ReplayScript::parse("events: [\n");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("Failed to parse"), std::string::npos);
}

TEST(ReplayScript, LoadMissingFile) {
    auto r = ReplayScript::load(fs::temp_directory_path() / "echoterm_no_such_script.yaml");
    EXPECT_TRUE(r.is_err());
}

TEST(ReplayScript, LoadFromFile) {
    fs::path path = fs::temp_directory_path() / "echoterm_replay_test.yaml";
    std::ofstream(path) << "events:\n  - keys: \"x\"\n  - output: \"x\"\n";

    auto r = ReplayScript::load(path);
    fs::remove(path);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.events.size(), 2u);
}

// ── run_replay ───────────────────────────────────────────────

TEST(Replay, TypedCommandConfirmedByShell) {
    auto report = run_replay(parse_ok(R"(
events:
  - keys: "ls"
  - output: "ls\r\n"
)"));
    EXPECT_EQ(report.writes, std::vector<std::string>({"l", "s", "\r", "\n"}));
    EXPECT_EQ(report.display, "ls\r\n");
    EXPECT_EQ(report.pending, 0u);
    EXPECT_TRUE(report.diagnostics.empty());
}

TEST(Replay, PasteIsNotEchoed) {
    auto report = run_replay(parse_ok(R"(
events:
  - input: "echo hi"
  - output: "echo hi"
)"));
    EXPECT_EQ(report.writes, std::vector<std::string>({"echo hi"}));
}

TEST(Replay, PauseWindowFollowsReplayClock) {
    auto report = run_replay(parse_ok(R"(
events:
  - keys: "a"
  - pause: 100
  - keys: "b"
  - advance: 100
  - keys: "c"
)"));
    EXPECT_EQ(report.display, "ac");
    EXPECT_EQ(report.pending, 1u);
}

TEST(Replay, MismatchIsReported) {
    auto report = run_replay(parse_ok(R"(
events:
  - keys: "x"
  - output: "y"
)"));
    ASSERT_EQ(report.diagnostics.size(), 1u);
    EXPECT_EQ(report.diagnostics[0], "Received: 'y' Had: 'x'");

    std::string text = format_report(report);
    EXPECT_NE(text.find("mismatches (1)"), std::string::npos);
    EXPECT_NE(text.find("pending: 0"), std::string::npos);
}

TEST(Replay, ClearDropsPending) {
    auto report = run_replay(parse_ok(R"(
events:
  - keys: "abc"
  - clear: true
  - output: "abc"
)"));
    EXPECT_EQ(report.display, "abcabc");
    EXPECT_TRUE(report.diagnostics.empty());
}

TEST(Replay, FormatReportEscapesWrites) {
    auto report = run_replay(parse_ok(R"(
events:
  - output: "\e[1mhi\e[0m\r\n"
)"));
    std::string text = format_report(report);
    EXPECT_NE(text.find("<ESC>[1mhi<ESC>[0m<CR><LF>"), std::string::npos);
    EXPECT_NE(text.find("text:    'hi'"), std::string::npos);
}
