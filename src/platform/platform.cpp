#include "platform.hpp"
#include <cstdlib>
#include <cstring>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#else
#  include <unistd.h>
#  include <sys/utsname.h>
extern char** environ;
#endif

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
    if (!home) home = std::getenv("HOME");
#else
    const char* home = std::getenv("HOME");
#endif
    if (!home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

std::string host_system_name() {
#ifdef _WIN32
    return "Windows";
#else
    struct utsname info;
    if (uname(&info) == 0) {
        return info.sysname;
    }
#  ifdef __APPLE__
    return "Darwin";
#  else
    return "Linux";
#  endif
#endif
}

std::string path_list_separator() {
#ifdef _WIN32
    return ";";
#else
    return ":";
#endif
}

std::map<std::string, std::string> environment_variables() {
    std::map<std::string, std::string> vars;

#ifdef _WIN32
    LPCH block = GetEnvironmentStringsA();
    if (!block) return vars;
    for (LPCH p = block; *p; p += std::strlen(p) + 1) {
        std::string entry(p);
        // Skip the hidden per-drive entries ("=C:=C:\\...")
        auto eq = entry.find('=', 1);
        if (eq == std::string::npos) continue;
        vars[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    FreeEnvironmentStringsA(block);
#else
    for (char** p = environ; p && *p; ++p) {
        std::string entry(*p);
        auto eq = entry.find('=');
        if (eq == std::string::npos || eq == 0) continue;
        vars[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
#endif

    return vars;
}

} // namespace platform
