#pragma once

#include <string>

class ControlMatcher;

namespace ansi {

// OSC string: ESC ] ... terminated by BEL or ST (ESC \).
extern const char* const OSC_REGEX;

// Escape sequences: ESC (or the UTF-8 encoded C1 CSI) followed by optional
// intermediates, parameters and a final byte.
extern const char* const ESCAPE_REGEX;

// Single-byte controls that move the cursor or ring the bell:
// BS, LF, CR, DEL, BEL.
extern const char* const CONTROL_BYTE_REGEX;

// All of the above as one alternation, in that order.
std::string control_regex();

// Render text for a human: printable ASCII and UTF-8 pass through, control
// bytes become <ESC>, <BS>, <CR>, <LF>, <BEL>, <DEL>, <TAB> or <0xNN>.
std::string pretty_print(const std::string& text);

// Remove every control span the matcher finds.
std::string strip(const std::string& text);
std::string strip(const std::string& text, const ControlMatcher& matcher);

} // namespace ansi
