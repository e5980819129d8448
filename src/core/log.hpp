#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <core/types.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

inline std::string echoterm_log_path() {
    static std::string path = (platform::temp_dir() / "echoterm_debug.log").string();
    return path;
}

inline void echoterm_log(const std::string& msg) {
    std::ofstream out(echoterm_log_path(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif

    out << fmt::format("[{:02d}:{:02d}:{:02d}.{:03d}] {}\n",
                       tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                       static_cast<int>(ms.count()), msg);
}

// Log a failed SSH step with its error text.
inline void echoterm_log_ssh(const std::string& label, const SSHResult& r) {
    echoterm_log(fmt::format("{} exit={} {}", label, r.exit_code, r.get_output().substr(0, 500)));
}
