#pragma once

#include <cstddef>
#include <optional>
#include <regex>
#include <string>

// A control span located inside a chunk of terminal output.
struct ControlMatch {
    size_t index;          // offset of the first byte within the searched text
    std::string value;     // the matched bytes, verbatim

    size_t end() const { return index + value.size(); }
};

// Finds control spans (escape sequences and single-byte controls) so the
// reconciler can exclude them from text matching. Implementations only have
// to honour leftmost-match-from-offset; nothing else about the engine is
// assumed.
class ControlMatcher {
public:
    virtual ~ControlMatcher() = default;

    // Leftmost control span starting at or after `from`, or nullopt.
    virtual std::optional<ControlMatch> next_match(const std::string& text, size_t from) const = 0;
};

// Default matcher: ANSI/VT escape sequences, OSC strings and the single-byte
// controls BS, LF, CR, DEL and BEL.
class ControlPattern : public ControlMatcher {
public:
    ControlPattern();
    explicit ControlPattern(const std::string& pattern);

    std::optional<ControlMatch> next_match(const std::string& text, size_t from) const override;

    const std::string& raw() const { return raw_; }

    // Shared default instance.
    static const ControlPattern& standard();

private:
    std::string raw_;
    std::regex regex_;
};
