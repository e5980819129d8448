#include "platform.hpp"
#include <chrono>
#include <cstdlib>
#include <thread>
#include <pwd.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    if (const char* override_home = std::getenv("ECHOTERM_HOME")) {
        if (*override_home) return fs::path(override_home);
    }
    if (const char* home = std::getenv("HOME")) {
        if (*home) return fs::path(home);
    }

    struct passwd pw;
    struct passwd* found = nullptr;
    char buf[4096];
    if (getpwuid_r(getuid(), &pw, buf, sizeof(buf), &found) == 0 && found && found->pw_dir) {
        return fs::path(found->pw_dir);
    }
    return temp_dir();
}

fs::path temp_dir() {
    std::error_code ec;
    fs::path dir = fs::temp_directory_path(ec);
    return ec ? fs::path("/tmp") : dir;
}

void sleep_ms(int ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

} // namespace platform
