#include "config.hpp"
#include "constants.hpp"
#include "log.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>

namespace fs = std::filesystem;

Config::Config()
    : presets_path_(DEFAULT_PRESETS_PATH),
      default_generator_(DEFAULT_GENERATOR),
      docker_compose_file_(DEFAULT_COMPOSE_FILE),
      default_container_name_(DEFAULT_CONTAINER_NAME),
      project_dir_(fs::current_path()) {}

fs::path get_global_config_dir() {
    return platform::home_dir() / ".config" / "cppforge";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / CONFIG_FILE_NAME;
}

fs::path get_project_config_path(const fs::path& dir) {
    return dir / CONFIG_FILE_NAME;
}

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

Result<void> create_default_global_config() {
    fs::path config_path = get_global_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    const char* default_config = R"(# cppforge configuration
# Project-local settings go in ./cppforge.yaml and override this file.

cmake:
  presets_path: "CMakePresets.json"
  default_generator: "Ninja"

docker:
  docker_compose_file: "docker-compose.yml"
  default_container_name: "gcc-clang-dev"
)";

    try {
        fs::create_directories(config_path.parent_path());
        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err(make_error(ErrorKind::ConfigError,
                "Failed to create config file at " + config_path.string()));
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err(make_error(ErrorKind::ConfigError,
            "Failed to write config file: " + std::string(e.what())));
    }
}

// Options may sit at the top level or under their section (cmake: / docker:).
// The section wins when both are present.
static void read_option(const YAML::Node& root, const char* section, const char* key,
                        std::string& out) {
    if (root[key] && root[key].IsScalar()) {
        out = root[key].as<std::string>();
    }
    if (root[section] && root[section].IsMap()) {
        const YAML::Node node = root[section][key];
        if (node && node.IsScalar()) {
            out = node.as<std::string>();
        }
    }
}

Result<Config> Config::parse(const std::string& yaml_text, Config base) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (!root || root.IsNull()) {
            return Result<Config>::Ok(base);
        }
        if (!root.IsMap()) {
            return Result<Config>::Err(make_error(ErrorKind::ConfigError,
                "configuration must be a mapping of options"));
        }

        read_option(root, "cmake", "presets_path", base.presets_path_);
        read_option(root, "cmake", "default_generator", base.default_generator_);
        read_option(root, "docker", "docker_compose_file", base.docker_compose_file_);
        read_option(root, "docker", "default_container_name", base.default_container_name_);

        return Result<Config>::Ok(base);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(make_error(ErrorKind::ConfigError,
            std::string("Failed to parse configuration: ") + e.what()));
    }
}

Result<Config> Config::load_file(const fs::path& path, Config base) {
    if (!fs::exists(path)) {
        return Result<Config>::Ok(base);
    }

    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err(make_error(ErrorKind::ConfigError,
            "Cannot read " + path.string()));
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    auto result = parse(text, base);
    if (result.is_err()) {
        result.error.field = path.string();
        return result;
    }
    forge_log("loaded config " + path.string());
    return result;
}

Result<Config> Config::load(const fs::path& project_dir) {
    Config config;
    config.project_dir_ = project_dir;

    // Load global first
    auto global_result = load_file(get_global_config_path(), config);
    if (global_result.is_err()) {
        return global_result;
    }

    // Project file overrides
    auto project_result = load_file(get_project_config_path(project_dir), global_result.value);
    if (project_result.is_err()) {
        return project_result;
    }

    const Config& c = project_result.value;
    forge_log(fmt::format("config: presets_path={} default_generator={} compose={} container={}",
                          c.presets_path(), c.default_generator(), c.docker_compose_file(),
                          c.default_container_name()));
    return project_result;
}
