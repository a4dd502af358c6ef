#include "log.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <fstream>

static bool g_log_echo = false;

std::string forge_log_path() {
    static std::string path = (platform::temp_dir() / DEBUG_LOG_NAME).string();
    return path;
}

void set_log_echo(bool enabled) {
    g_log_echo = enabled;
}

bool log_echo_enabled() {
    return g_log_echo;
}

void forge_log(const std::string& msg) {
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

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));

    if (g_log_echo) {
        fmt::print(stderr, "\033[38;2;80;80;80m    \xc2\xb7 {}\033[0m\n", msg);
    }

    std::ofstream out(forge_log_path(), std::ios::app);
    if (!out) return;
    out << "[" << ts << "] " << msg << "\n";
}
