#include "ansi.hpp"
#include "control_pattern.hpp"
#include <fmt/format.h>

namespace ansi {

const char* const OSC_REGEX =
    "\\x1b\\][^\\x07\\x1b]*(?:\\x07|\\x1b\\\\)";

// UTF-8 encoding of U+009B (CSI) is C2 9B; matching the raw 0x9B byte alone
// would hit continuation bytes of unrelated multi-byte characters.
const char* const ESCAPE_REGEX =
    "(?:\\x1b|\xc2\x9b)[\\[\\]()#;?]*"
    "(?:(?:(?:[a-zA-Z\\d]*(?:;[a-zA-Z\\d]*)*)?\\x07)"
    "|(?:(?:\\d{1,4}(?:;\\d{0,4})*)?[\\dA-PRZcf-ntqry=><~]))";

const char* const CONTROL_BYTE_REGEX = "[\\x08\\n\\r\\x7f\\x07]";

std::string control_regex() {
    return fmt::format("(?:{})|(?:{})|(?:{})", OSC_REGEX, ESCAPE_REGEX, CONTROL_BYTE_REGEX);
}

std::string pretty_print(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        auto b = static_cast<unsigned char>(c);
        switch (b) {
            case 0x1b: out += "<ESC>"; break;
            case 0x08: out += "<BS>"; break;
            case 0x0d: out += "<CR>"; break;
            case 0x0a: out += "<LF>"; break;
            case 0x07: out += "<BEL>"; break;
            case 0x7f: out += "<DEL>"; break;
            case 0x09: out += "<TAB>"; break;
            default:
                if (b < 0x20) {
                    out += fmt::format("<0x{:02X}>", b);
                } else {
                    out += c;
                }
        }
    }
    return out;
}

std::string strip(const std::string& text) {
    return strip(text, ControlPattern::standard());
}

std::string strip(const std::string& text, const ControlMatcher& matcher) {
    std::string out;
    size_t cursor = 0;
    auto match = matcher.next_match(text, 0);
    while (match) {
        out.append(text, cursor, match->index - cursor);
        cursor = match->end();
        match = matcher.next_match(text, cursor);
    }
    out.append(text, cursor, std::string::npos);
    return out;
}

} // namespace ansi
