#pragma once

#include <string>
#include <map>
#include <filesystem>
#include <core/types.hpp>
#include <core/config.hpp>
#include <pipeline/executor.hpp>

// Brings up the development container with docker compose. One command,
// no lifecycle tracking: stopping and removing the container is left to
// docker itself.
class ContainerManager {
public:
    ContainerManager(const Config& config, CommandRunner& runner,
                     std::map<std::string, std::string> environment);

    // docker compose -f <compose file> up -d dev, with PROJECT_DIR set to
    // the project directory. The compose file must exist.
    Result<void> spinup(StatusCallback cb = nullptr);

    // The command line that spinup() would run.
    Invocation spinup_invocation() const;

    // "docker exec -it <container> zsh"
    std::string attach_command() const;

    std::filesystem::path compose_file() const;

private:
    const Config& config_;
    CommandRunner& runner_;
    std::map<std::string, std::string> environment_;
};
