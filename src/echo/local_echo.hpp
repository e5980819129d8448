#pragma once

#include <chrono>
#include <functional>
#include <string>
#include "control_pattern.hpp"
#include "diagnostics.hpp"
#include "echo_queue.hpp"
#include "pause_gate.hpp"

// LocalEcho: draw typed characters immediately and reconcile them against
// the remote's own echo when it arrives.
//
// Keystrokes go through echo(): single printable characters (and backspace)
// are written to the display at once and remembered. Remote output goes
// through write(): literal text is matched against the remembered
// characters so nothing is drawn twice; control sequences are passed through
// untouched and excluded from matching. Text that cannot be matched is
// logged to diagnostics(), the remembered characters are dropped, and the
// output is written as received.
//
//     LocalEcho echo([](const std::string& s) { ::write(1, s.data(), s.size()); });
//     echo.echo("l");           // drawn now
//     echo.echo("s");           // drawn now
//     echo.write("ls\r\n");     // only "\r\n" reaches the display
//
// Not thread-safe. echo() and write() must never run concurrently; both
// share the queue without locking. A multi-threaded host must hold one mutex
// across each whole call to either.
class LocalEcho {
public:
    using Writer = std::function<void(const std::string&)>;

    explicit LocalEcho(Writer writer);
    LocalEcho(Writer writer, PauseGate::NowFn now);

    // Use a different control-sequence matcher. The matcher must outlive
    // this object.
    void set_matcher(const ControlMatcher& matcher) { matcher_ = &matcher; }
    void set_matcher(const ControlMatcher&&) = delete;

    // Keystroke path.
    void echo(const std::string& input);

    // Remote output path.
    void write(const std::string& output);

    bool empty() const { return queue_.empty(); }
    size_t pending() const { return queue_.size(); }
    void clear();

    // Stop echoing for `pause_ms` and abandon anything still pending.
    void pause(int pause_ms);
    bool paused();

    TerminalDiagnostics& diagnostics() { return diagnostics_; }
    const TerminalDiagnostics& diagnostics() const { return diagnostics_; }
    std::string get_diagnostics() const { return diagnostics_.get_log(); }
    void reset_diagnostics() { diagnostics_.reset_log(); }

private:
    Writer writer_;
    EchoQueue queue_;
    PauseGate gate_;
    TerminalDiagnostics diagnostics_;
    const ControlMatcher* matcher_;

    // Skip what was already echoed, write the rest. Returns the number of
    // bytes matched against the queue; 0 means the queue disagreed.
    size_t output_non_echoed(const std::string& text);
};
