#include "utils.hpp"

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

std::string format_command(const std::string& program, const std::vector<std::string>& args) {
    auto quote = [](const std::string& s) {
        if (!s.empty() && s.find_first_of(" \t\"'") == std::string::npos) return s;
        std::string q = "\"";
        for (char c : s) {
            if (c == '"' || c == '\\') q += '\\';
            q += c;
        }
        return q + "\"";
    };

    std::string out = quote(program);
    for (const auto& a : args) {
        out += " " + quote(a);
    }
    return out;
}
