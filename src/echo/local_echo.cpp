#include "local_echo.hpp"
#include "ansi.hpp"
#include <fmt/format.h>

static const std::string BACKSPACE = "\b";

LocalEcho::LocalEcho(Writer writer)
    : writer_(std::move(writer)), matcher_(&ControlPattern::standard()) {}

LocalEcho::LocalEcho(Writer writer, PauseGate::NowFn now)
    : writer_(std::move(writer)), gate_(std::move(now)),
      matcher_(&ControlPattern::standard()) {}

// ── Keystroke path ─────────────────────────────────────────────

void LocalEcho::echo(const std::string& input) {
    if (paused()) return;

    // More than one byte is a paste or an escape sequence from a special
    // key; the remote will not mirror it byte for byte.
    if (input.size() != 1) return;

    char ch = input[0];
    if ((ch >= 0x20 && ch <= 0x7e) || ch == '\b') {
        queue_.record(ch);
        writer_(input);
    }
}

// ── Remote output path ─────────────────────────────────────────

// Shells rewrite the line around fast typing and backspacing: ^H ESC[K
// pairs, a BEL when backspacing at column 0. Those spans are excluded from
// matching, otherwise the queue drifts and leaves characters on screen the
// user cannot backspace over.
void LocalEcho::write(const std::string& output) {
    size_t chunk_start = 0;
    auto match = matcher_->next_match(output, 0);

    while (match) {
        size_t chunk_end = match->index;

        if (chunk_end > chunk_start) {
            std::string literal = output.substr(chunk_start, chunk_end - chunk_start);
            if (output_non_echoed(literal) == 0) {
                // Out of sync; show the rest of the chunk as received.
                writer_(output.substr(chunk_end));
                return;
            }
        }

        if (match->value == BACKSPACE && !queue_.empty()) {
            // A typed backspace is already on screen and in the queue. A
            // server-generated one is not, and the queue still holds a
            // character the server does not know was drawn, so the cursor
            // has to move back one extra cell.
            auto popped = queue_.consume_front();
            if (*popped != '\b') {
                writer_(match->value);
            }
        }

        writer_(match->value);

        chunk_start = match->end();
        match = matcher_->next_match(output, chunk_start);
    }

    output_non_echoed(output.substr(chunk_start));
}

size_t LocalEcho::output_non_echoed(const std::string& text) {
    std::string last_output;
    while (!queue_.empty() && last_output.size() < text.size()) {
        last_output += *queue_.consume_front();
    }

    if (last_output == text) {
        return text.size();
    }

    if (text.compare(0, last_output.size(), last_output) == 0) {
        writer_(text.substr(last_output.size()));
        return last_output.size();
    }

    diagnostics_.log(fmt::format("Received: '{}' Had: '{}'",
                                 ansi::pretty_print(text),
                                 ansi::pretty_print(last_output)));
    queue_.clear();
    writer_(text);
    return 0;
}

// ── State ──────────────────────────────────────────────────────

void LocalEcho::clear() {
    queue_.clear();
}

void LocalEcho::pause(int pause_ms) {
    gate_.pause(std::chrono::milliseconds(pause_ms));
    clear();
}

bool LocalEcho::paused() {
    return gate_.paused();
}
