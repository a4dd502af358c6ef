#pragma once

#include <string>
#include <vector>
#include <map>
#include <set>
#include <optional>
#include "preset.hpp"

// A preset after inheritance and macro expansion: no nulls, no tokens.
struct ResolvedConfiguration {
    PresetKind kind = PresetKind::Configure;
    std::string preset_name;
    std::string display_name;
    std::string description;

    std::optional<std::string> generator;
    std::optional<std::string> binary_dir;
    std::optional<std::string> install_dir;
    std::optional<std::string> toolchain_file;
    std::optional<std::string> target_executable;
    std::map<std::string, CacheVariable> cache_variables;

    // Preset environment. Names explicitly set to null end up in
    // unset_environment and are removed from the child's environment.
    std::map<std::string, std::string> environment;
    std::set<std::string> unset_environment;

    std::optional<std::string> configure_preset;
    std::optional<std::string> configuration;
    std::vector<std::string> targets;
    std::optional<int> jobs;

    bool operator==(const ResolvedConfiguration& other) const;
    bool operator!=(const ResolvedConfiguration& other) const { return !(*this == other); }
};
