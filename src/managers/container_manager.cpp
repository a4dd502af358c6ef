#include "container_manager.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

namespace fs = std::filesystem;

ContainerManager::ContainerManager(const Config& config, CommandRunner& runner,
                                   std::map<std::string, std::string> environment)
    : config_(config), runner_(runner), environment_(std::move(environment)) {}

fs::path ContainerManager::compose_file() const {
    fs::path file(config_.docker_compose_file());
    if (file.is_relative()) file = config_.project_dir() / file;
    return file.lexically_normal();
}

Invocation ContainerManager::spinup_invocation() const {
    Invocation inv;
    inv.program = DOCKER_PROGRAM;
    inv.args = {"compose", "-f", compose_file().string(), "up", "-d", COMPOSE_SERVICE};
    inv.working_dir = config_.project_dir().string();
    inv.environment = environment_;
    inv.environment["PROJECT_DIR"] = config_.project_dir().string();
    return inv;
}

std::string ContainerManager::attach_command() const {
    return fmt::format("{} exec -it {} {}", DOCKER_PROGRAM,
                       config_.default_container_name(), CONTAINER_SHELL);
}

Result<void> ContainerManager::spinup(StatusCallback cb) {
    fs::path file = compose_file();
    std::error_code ec;
    if (!fs::is_regular_file(file, ec)) {
        return Result<void>::Err(make_error(ErrorKind::PreconditionFailed,
            fmt::format("compose file '{}' not found", file.string()),
            "", "docker_compose_file"));
    }

    Invocation inv = spinup_invocation();
    if (cb) cb(format_command(inv.program, inv.args));
    forge_log("spinup: " + format_command(inv.program, inv.args));

    auto result = runner_.run(inv);
    if (result.is_err()) {
        return Result<void>::Err(result.error);
    }
    if (result.value != 0) {
        Error e = make_error(ErrorKind::StepFailed,
            fmt::format("docker compose exited with status {}", result.value), "", "spinup");
        e.exit_code = result.value > 0 ? result.value : EXIT_GENERIC_FAILURE;
        return Result<void>::Err(e);
    }
    return Result<void>::Ok();
}
