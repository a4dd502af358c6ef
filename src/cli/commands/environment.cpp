#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <core/config.hpp>
#include <managers/container_manager.hpp>

static int do_spinup(BaseCLI& cli, const CommandOptions& opts) {
    auto cfg = cli.ensure_config();
    if (cfg.is_err()) return cli.report(cfg.error);

    ContainerManager containers(cli.config.value(), *cli.runner, cli.host.variables);
    auto result = containers.spinup(cli.status_printer());
    if (result.is_err()) return cli.report(result.error);

    std::cout << theme::ok("Development container is up.");
    std::cout << theme::step("Attach with: " + containers.attach_command());
    return 0;
}

static int do_setup(BaseCLI& cli, const CommandOptions& opts) {
    if (global_config_exists()) {
        std::cout << theme::info("Config already exists at " + get_global_config_path().string());
        return 0;
    }

    auto result = create_default_global_config();
    if (result.is_err()) return cli.report(result.error);

    std::cout << theme::ok("Wrote " + get_global_config_path().string());
    return 0;
}

void register_environment_commands(BaseCLI& cli) {
    cli.add_command("spinup", do_spinup, "Start the development container");
    cli.add_command("setup", do_setup, "Write the default user configuration");
}
