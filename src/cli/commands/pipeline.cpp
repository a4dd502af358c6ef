#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <pipeline/orchestrator.hpp>

static Result<void> check_pipeline_options(Verb verb, const CommandOptions& opts) {
    auto usage = [](const std::string& msg) {
        return Result<void>::Err(make_error(ErrorKind::UsageError, msg));
    };

    if (opts.preset.empty()) {
        return usage(fmt::format("{} needs --preset <name>", verb_name(verb)));
    }
    if (opts.kind) {
        return usage(fmt::format("{} does not take --kind", verb_name(verb)));
    }
    if (opts.export_compile_commands && verb != Verb::Generate) {
        return usage("--export-compile-commands only applies to generate");
    }

    bool runs = verb == Verb::Run || verb == Verb::BuildRun;
    if (!runs && !opts.executable.empty()) {
        return usage(fmt::format("{} does not run anything; drop --executable", verb_name(verb)));
    }
    if (!runs && !opts.passthrough.empty()) {
        return usage(fmt::format("{} does not take program arguments", verb_name(verb)));
    }
    return Result<void>::Ok();
}

static int run_pipeline(BaseCLI& cli, Verb verb, const CommandOptions& opts) {
    auto valid = check_pipeline_options(verb, opts);
    if (valid.is_err()) return cli.report(valid.error);

    auto cfg = cli.ensure_config();
    if (cfg.is_err()) return cli.report(cfg.error);

    auto document = cli.load_presets(opts);
    if (document.is_err()) return cli.report(document.error);

    PipelineOrchestrator orchestrator(cli.config.value(), document.value, cli.host,
                                      *cli.runner, cli.status_printer());

    PipelineRequest request;
    request.verb = verb;
    request.preset = opts.preset;
    request.export_compile_commands = opts.export_compile_commands;
    request.executable = opts.executable;
    request.run_args = opts.passthrough;

    auto result = orchestrator.execute(request);
    if (result.is_err()) return cli.report(result.error);

    if (verb != Verb::Run && verb != Verb::BuildRun) {
        std::cout << theme::ok(fmt::format("{} finished for preset '{}'",
                                           verb_name(verb), opts.preset));
    }
    return 0;
}

void register_pipeline_commands(BaseCLI& cli) {
    cli.add_command("generate", [](BaseCLI& cli, const CommandOptions& opts) {
        return run_pipeline(cli, Verb::Generate, opts);
    }, "Configure the build tree for a preset");

    cli.add_command("build", [](BaseCLI& cli, const CommandOptions& opts) {
        return run_pipeline(cli, Verb::Build, opts);
    }, "Build a configured preset");

    cli.add_command("run", [](BaseCLI& cli, const CommandOptions& opts) {
        return run_pipeline(cli, Verb::Run, opts);
    }, "Run the preset's executable");

    cli.add_command("build-run", [](BaseCLI& cli, const CommandOptions& opts) {
        return run_pipeline(cli, Verb::BuildRun, opts);
    }, "Build, then run the executable");
}
