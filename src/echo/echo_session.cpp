#include "echo_session.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <filesystem>
#include <fstream>

EchoSession::EchoSession(const EchoConfig& config, Writer display, Sender sender)
    : config_(config), display_(display), sender_(std::move(sender)), echo_(display) {}

EchoSession::EchoSession(const EchoConfig& config, Writer display, Sender sender,
                         PauseGate::NowFn now)
    : config_(config), display_(display), sender_(std::move(sender)),
      echo_(display, std::move(now)) {}

bool EchoSession::handle_input(const std::string& keys) {
    if (config_.enabled && keys.size() == 1) {
        char c = keys[0];
        bool pause_key = (c == KEY_TAB && config_.pause_on_tab) ||
                         (c == KEY_CTRL_C && config_.pause_on_interrupt);
        if (pause_key) {
            echo_.pause(config_.pause_ms);
        } else {
            echo_.echo(keys);
        }
    }
    return sender_(keys);
}

void EchoSession::handle_output(const std::string& output) {
    if (config_.enabled) {
        echo_.write(output);
    } else {
        display_(output);
    }
}

Result<void> EchoSession::dump_diagnostics(const DiagnosticsConfig& diag,
                                           const std::string& target) const {
    if (!has_mismatches() || diag.dump_path.empty()) return Result<void>::Ok();

    std::filesystem::path path(diag.dump_path);
    std::error_code ec;
    if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);

    std::ofstream out(path, std::ios::app);
    if (!out) {
        return Result<void>::Err("Cannot write diagnostics to " + path.string());
    }
    out << fmt::format("[{}] {}\n", now_iso(), target);
    out << echo_.get_diagnostics();
    return Result<void>::Ok();
}
