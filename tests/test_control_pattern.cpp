#include <gtest/gtest.h>
#include <echo/control_pattern.hpp>
#include <regex>
#include <vector>

static std::optional<ControlMatch> first(const std::string& text, size_t from = 0) {
    return ControlPattern::standard().next_match(text, from);
}

TEST(ControlPattern, NoMatchInPlainText) {
    EXPECT_FALSE(first("hello world").has_value());
    EXPECT_FALSE(first("").has_value());
}

TEST(ControlPattern, FromPastEndIsNoMatch) {
    EXPECT_FALSE(first("\r", 1).has_value());
    EXPECT_FALSE(first("\r", 7).has_value());
}

TEST(ControlPattern, SingleByteControls) {
    for (const std::string c : {"\b", "\n", "\r", "\x7f", "\x07"}) {
        auto m = first("ab" + c + "cd");
        ASSERT_TRUE(m.has_value()) << static_cast<int>(c[0]);
        EXPECT_EQ(m->index, 2u);
        EXPECT_EQ(m->value, c);
    }
}

TEST(ControlPattern, TabIsNotAControlSpan) {
    EXPECT_FALSE(first("a\tb").has_value());
}

TEST(ControlPattern, SgrSequence) {
    auto m = first("ab\x1b[31mcd");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->index, 2u);
    EXPECT_EQ(m->value, "\x1b[31m");
    EXPECT_EQ(m->end(), 7u);
}

TEST(ControlPattern, EraseAndPrivateModes) {
    auto erase = first("\x1b[K");
    ASSERT_TRUE(erase.has_value());
    EXPECT_EQ(erase->value, "\x1b[K");

    auto bracketed = first("x\x1b[?2004h");
    ASSERT_TRUE(bracketed.has_value());
    EXPECT_EQ(bracketed->index, 1u);
    EXPECT_EQ(bracketed->value, "\x1b[?2004h");
}

TEST(ControlPattern, CursorPositionWithParameters) {
    auto m = first("\x1b[12;40H!");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->value, "\x1b[12;40H");
}

TEST(ControlPattern, OscTitleTerminatedByBell) {
    std::string title = "\x1b]0;user@host: ~/src\x07";
    auto m = first(title + "$ ");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->index, 0u);
    EXPECT_EQ(m->value, title);
}

TEST(ControlPattern, OscTerminatedByStringTerminator) {
    std::string osc = "\x1b]7;file://host/home\x1b\\";
    auto m = first(osc + "x");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->value, osc);
}

TEST(ControlPattern, EncodedC1Csi) {
    auto m = first("a\xc2\x9b" "1m");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->index, 1u);
    EXPECT_EQ(m->value, "\xc2\x9b" "1m");
}

TEST(ControlPattern, MultiByteCharacterIsNotC1) {
    // U+201B encodes as E2 80 9B
    EXPECT_FALSE(first("\xe2\x80\x9b" "1m").has_value());
}

TEST(ControlPattern, SearchStartsAtOffset) {
    std::string text = "\rab\rcd";
    auto m = first(text, 1);
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->index, 3u);
    EXPECT_EQ(m->value, "\r");
}

TEST(ControlPattern, IteratesLeftToRight) {
    std::string text = "a\x1b[1mb\rc\n";
    std::vector<std::string> found;
    auto m = first(text);
    while (m) {
        found.push_back(m->value);
        m = first(text, m->end());
    }
    EXPECT_EQ(found, std::vector<std::string>({"\x1b[1m", "\r", "\n"}));
}

TEST(ControlPattern, CustomPattern) {
    ControlPattern pattern("X+");
    auto m = pattern.next_match("abXXc", 0);
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->index, 2u);
    EXPECT_EQ(m->value, "XX");
    EXPECT_EQ(pattern.raw(), "X+");
}

TEST(ControlPattern, EmptyMatchesAreIgnored) {
    ControlPattern pattern("X*");
    EXPECT_FALSE(pattern.next_match("abc", 0).has_value());
}

TEST(ControlPattern, InvalidPatternThrows) {
    EXPECT_THROW(ControlPattern("("), std::regex_error);
}
