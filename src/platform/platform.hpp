#pragma once

#include <string>
#include <map>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
std::filesystem::path temp_dir();

// Name of the host OS as CMake reports it ("Linux", "Darwin", "Windows", ...).
std::string host_system_name();

// Separator between entries of PATH-like lists (":" on Unix, ";" on Windows).
std::string path_list_separator();

// Snapshot of the current process environment.
std::map<std::string, std::string> environment_variables();

} // namespace platform
