#pragma once

#include <string>
#include <vector>

// Join with a separator ("a b c").
std::string join(const std::vector<std::string>& parts, const std::string& sep = " ");

// Render a command line for display, quoting arguments that contain spaces.
std::string format_command(const std::string& program, const std::vector<std::string>& args);
