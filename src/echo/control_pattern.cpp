#include "control_pattern.hpp"
#include "ansi.hpp"

ControlPattern::ControlPattern() : ControlPattern(ansi::control_regex()) {}

// Throws std::regex_error if the pattern does not compile.
ControlPattern::ControlPattern(const std::string& pattern)
    : raw_(pattern), regex_(pattern, std::regex::ECMAScript) {}

std::optional<ControlMatch> ControlPattern::next_match(const std::string& text, size_t from) const {
    if (from >= text.size()) return std::nullopt;

    auto flags = from > 0 ? std::regex_constants::match_prev_avail
                          : std::regex_constants::match_default;
    std::smatch m;
    if (!std::regex_search(text.begin() + from, text.end(), m, regex_, flags)) {
        return std::nullopt;
    }

    // An empty span would never advance the caller's cursor.
    if (m.length(0) == 0) return std::nullopt;

    return ControlMatch{from + static_cast<size_t>(m.position(0)), m.str(0)};
}

const ControlPattern& ControlPattern::standard() {
    static const ControlPattern pattern;
    return pattern;
}
