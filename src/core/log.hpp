#pragma once

#include <string>

// Debug log at <tmp>/cppforge_debug.log.
std::string forge_log_path();

// Echo log lines to stderr as well as the debug file (--verbose).
void set_log_echo(bool enabled);
bool log_echo_enabled();

// Append a timestamped line to the debug log.
void forge_log(const std::string& msg);
