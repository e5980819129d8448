#pragma once

#include <functional>
#include <string>
#include <core/types.hpp>
#include "local_echo.hpp"

// EchoSession: the keystroke and output policy of an interactive shell,
// independent of the transport carrying it.
//
// Keys read in one go are always forwarded through the sender. A read of a
// single byte is also drawn through LocalEcho, except Tab and Ctrl-C, which
// pause echo instead (each switchable in EchoConfig). Output is reconciled by
// LocalEcho, or written straight to the display when local echo is off.
class EchoSession {
public:
    using Writer = LocalEcho::Writer;
    using Sender = std::function<bool(const std::string&)>;

    EchoSession(const EchoConfig& config, Writer display, Sender sender);
    EchoSession(const EchoConfig& config, Writer display, Sender sender, PauseGate::NowFn now);

    // Returns false if the sender failed.
    bool handle_input(const std::string& keys);
    void handle_output(const std::string& output);

    bool has_mismatches() const { return !echo_.diagnostics().empty(); }

    // Append the mismatch log under a `[time] target` header. Writes nothing
    // when there are no mismatches or no dump path.
    Result<void> dump_diagnostics(const DiagnosticsConfig& diag, const std::string& target) const;

    LocalEcho& local_echo() { return echo_; }

private:
    EchoConfig config_;
    Writer display_;
    Sender sender_;
    LocalEcho echo_;
};
