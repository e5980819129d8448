#pragma once

#include <string>
#include <core/types.hpp>
#include <echo/echo_session.hpp>

class SessionManager;

// ShellRelay: interactive stdin/stdout relay for an established shell.
//
// Keystrokes are forwarded to the channel; a keystroke that arrives alone
// in one read is also drawn locally through LocalEcho. Channel output is
// reconciled by LocalEcho before it reaches stdout, so locally drawn
// characters are not drawn a second time when the shell echoes them.
//
// Tab and Ctrl-C pause local echo (configurable): completion listings and
// interrupted commands produce output that never mirrors the keystrokes.
//
// Usage:
//     SessionManager session(cfg.session());
//     session.establish(cb);
//     ShellRelay relay(session, cfg.local_echo(), cfg.diagnostics());
//     int status = relay.run();
class ShellRelay {
public:
    ShellRelay(SessionManager& session, const EchoConfig& echo, const DiagnosticsConfig& diag);

    // Relay until the remote shell exits or stdin closes. Handles raw mode
    // and resize propagation. Returns the remote exit status (-1 if unknown).
    int run();

    LocalEcho& local_echo() { return echo_.local_echo(); }

private:
    SessionManager& session_;
    DiagnosticsConfig diag_cfg_;
    EchoSession echo_;

    bool send(const std::string& data);
};
