#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// Settings from cppforge.yaml. Loaded once at startup, then passed by
// const reference to whatever needs it.
class Config {
public:
    // Built-in defaults <- ~/.config/cppforge/cppforge.yaml <- ./cppforge.yaml
    static Result<Config> load(const fs::path& project_dir = fs::current_path());

    // Overlay one YAML file onto `base`. A missing file leaves base as-is.
    static Result<Config> load_file(const fs::path& path, Config base);

    // Overlay YAML text onto `base`.
    static Result<Config> parse(const std::string& yaml_text, Config base = Config());

    // Accessors
    const std::string& presets_path() const { return presets_path_; }
    const std::string& default_generator() const { return default_generator_; }
    const std::string& docker_compose_file() const { return docker_compose_file_; }
    const std::string& default_container_name() const { return default_container_name_; }
    const fs::path& project_dir() const { return project_dir_; }

    Config();

private:
    std::string presets_path_;
    std::string default_generator_;
    std::string docker_compose_file_;
    std::string default_container_name_;
    fs::path project_dir_;
};

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();
fs::path get_project_config_path(const fs::path& dir = fs::current_path());

bool global_config_exists();

// Write the default global config. Never overwrites an existing file.
Result<void> create_default_global_config();
