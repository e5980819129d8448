#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include "cli/theme.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <echo/replay.hpp>
#include <platform/terminal.hpp>
#include <ssh/session.hpp>
#include <ssh/shell_relay.hpp>

static void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::usage("echoterm connect", "[user@]host[:port]", "Open a shell with local echo");
    std::cout << theme::usage("echoterm replay", "<script.yaml>", "Run a scripted session offline");
    std::cout << theme::usage("echoterm config", "", "Create ~/.echoterm/config.yaml");
    std::cout << "\n";
    std::cout << theme::dim("    echoterm --version        Show version\n"
                            "    echoterm --help           Show this help")
              << "\n\n";
}

static Config load_config_or_defaults() {
    if (!global_config_exists()) {
        return Config();
    }
    auto result = Config::load_global();
    if (result.is_err()) {
        throw std::runtime_error(result.error);
    }
    return result.value;
}

static int run_connect(const std::string& target) {
    Config config = load_config_or_defaults();

    if (!target.empty()) {
        auto applied = config.apply_target(target);
        if (applied.is_err()) {
            std::cout << theme::fail(applied.error);
            return 1;
        }
    }

    SessionConfig session_cfg = config.session();
    if (session_cfg.host.empty()) {
        std::cout << theme::fail("No host given.");
        std::cout << theme::step("Usage: echoterm connect [user@]host[:port]");
        std::cout << theme::step("Or set session.host in " + get_global_config_path().string());
        return 1;
    }
    if (session_cfg.user.empty()) {
        const char* env_user = std::getenv("USER");
        session_cfg.user = env_user ? env_user : "";
    }
    if (!session_cfg.password && !session_cfg.ssh_key_path && platform::stdin_is_tty()) {
        session_cfg.password = platform::read_secret(
            session_cfg.user + "@" + session_cfg.host + "'s password: ");
    }

    SessionManager session(session_cfg);
    auto result = session.establish([](const std::string& msg) {
        std::cout << theme::log(msg) << std::flush;
    });
    if (result.failed()) {
        std::cout << theme::fail(result.stderr_data);
        return 1;
    }

    ShellRelay relay(session, config.local_echo(), config.diagnostics());
    int status = relay.run();
    session.close();

    std::cout << "\r\n" << theme::ok("Connection to " + session_cfg.host + " closed.");
    const auto& diag = config.diagnostics();
    size_t mismatches = relay.local_echo().diagnostics().entries().size();
    if (mismatches > 0 && (diag.debug_log || !diag.dump_path.empty())) {
        std::cout << theme::step(fmt::format("{} local-echo mismatches logged to {}", mismatches,
                                             diag.dump_path.empty() ? echoterm_log_path()
                                                                    : diag.dump_path));
    }
    return status < 0 ? 0 : status;
}

static int run_replay_cmd(const std::string& path) {
    auto script = ReplayScript::load(path);
    if (script.is_err()) {
        std::cout << theme::fail(script.error);
        return 1;
    }

    auto report = run_replay(script.value);
    std::cout << theme::section("Replay " + path);
    std::cout << format_report(report);
    return 0;
}

static int run_config() {
    auto result = create_default_global_config();
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return 1;
    }
    std::cout << theme::ok("Config at " + get_global_config_path().string());
    return 0;
}

int main(int argc, char** argv) {
    try {
        if (argc == 1) {
            return run_connect("");
        }

        std::string cmd = argv[1];

        if (cmd == "--version") {
            std::cout << theme::color::CYAN << theme::color::BOLD << "echoterm"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << ECHOTERM_VERSION << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help") {
            print_usage();
            return 0;
        } else if (cmd == "connect") {
            return run_connect(argc >= 3 ? argv[2] : "");
        } else if (cmd == "replay") {
            if (argc < 3) {
                std::cout << theme::fail("Missing script path.");
                std::cout << theme::step("Usage: echoterm replay <script.yaml>");
                return 1;
            }
            return run_replay_cmd(argv[2]);
        } else if (cmd == "config") {
            return run_config();
        } else {
            std::cout << theme::fail("Unknown command: " + cmd);
            print_usage();
            return 1;
        }
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
