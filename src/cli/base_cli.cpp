#include "base_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <presets/document_loader.hpp>
#include <iostream>
#include <fmt/format.h>

namespace fs = std::filesystem;

Result<CommandOptions> parse_command_options(const std::vector<std::string>& args) {
    CommandOptions opts;

    auto usage = [](const std::string& msg) {
        return Result<CommandOptions>::Err(make_error(ErrorKind::UsageError, msg));
    };

    for (size_t i = 0; i < args.size(); ++i) {
        std::string arg = args[i];

        if (arg == "--") {
            opts.passthrough.assign(args.begin() + i + 1, args.end());
            break;
        }

        std::string name = arg;
        std::optional<std::string> inline_value;
        auto eq = arg.find('=');
        if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
            name = arg.substr(0, eq);
            inline_value = arg.substr(eq + 1);
        }

        auto take_value = [&](std::string& out) -> bool {
            if (inline_value) {
                out = *inline_value;
            } else if (i + 1 < args.size()) {
                out = args[++i];
            } else {
                return false;
            }
            return !out.empty();
        };

        auto is_flag = [&]() { return !inline_value.has_value(); };

        if (name == "--preset") {
            if (!take_value(opts.preset)) return usage("--preset needs a preset name");
        } else if (name == "--executable") {
            if (!take_value(opts.executable)) return usage("--executable needs a path");
        } else if (name == "--presets-file") {
            if (!take_value(opts.presets_file)) return usage("--presets-file needs a path");
        } else if (name == "--kind") {
            std::string kind;
            if (!take_value(kind)) return usage("--kind needs one of configure, build, test");
            opts.kind = parse_preset_kind(kind);
            if (!opts.kind) return usage(fmt::format("unknown preset kind '{}'", kind));
        } else if (name == "--export-compile-commands" && is_flag()) {
            opts.export_compile_commands = true;
        } else if (name == "--verbose" && is_flag()) {
            opts.verbose = true;
        } else if ((name == "--help" || name == "-h") && is_flag()) {
            opts.help = true;
        } else if (!name.empty() && name[0] == '-') {
            return usage(fmt::format("unknown option '{}'", arg));
        } else {
            return usage(fmt::format("unexpected argument '{}'", arg));
        }
    }

    return Result<CommandOptions>::Ok(opts);
}

bool option_takes_value(const std::string& name) {
    return name == "--preset" || name == "--executable" ||
           name == "--presets-file" || name == "--kind";
}

int exit_code_for(const Error& error) {
    switch (error.kind) {
        case ErrorKind::StepFailed:
            return error.exit_code;
        case ErrorKind::UsageError:
            return EXIT_USAGE;
        default:
            return EXIT_GENERIC_FAILURE;
    }
}

BaseCLI::BaseCLI()
    : runner(std::make_unique<ProcessExecutor>()),
      host(HostEnvironment::current()) {}

void BaseCLI::add_command(const std::string& name,
                          CommandHandler handler,
                          const std::string& help) {
    commands_[name] = {handler, help};
}

bool BaseCLI::has_command(const std::string& name) const {
    return commands_.count(name) > 0;
}

Result<void> BaseCLI::ensure_config() {
    if (config.has_value()) {
        return Result<void>::Ok();
    }
    auto loaded = Config::load();
    if (loaded.is_err()) {
        return Result<void>::Err(loaded.error);
    }
    config = loaded.value;
    return Result<void>::Ok();
}

fs::path BaseCLI::presets_path(const CommandOptions& opts) const {
    fs::path path = !opts.presets_file.empty()
        ? fs::path(opts.presets_file)
        : fs::path(config ? config->presets_path() : DEFAULT_PRESETS_PATH);
    if (path.is_relative() && config) {
        path = config->project_dir() / path;
    }
    return path;
}

Result<PresetDocument> BaseCLI::load_presets(const CommandOptions& opts) const {
    return load_preset_document(presets_path(opts));
}

int BaseCLI::report(const Error& error) const {
    std::cout << theme::fail(error.describe());
    if (error.kind == ErrorKind::UsageError) {
        std::cout << theme::step("Run 'cppforge help' for usage.");
    }
    forge_log("error: " + error.describe());
    return exit_code_for(error);
}

StatusCallback BaseCLI::status_printer() const {
    return [](const std::string& msg) {
        std::cout << theme::step(msg) << std::flush;
    };
}

int BaseCLI::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        return report(make_error(ErrorKind::UsageError, "Unknown command: " + command));
    }

    auto opts = parse_command_options(args);
    if (opts.is_err()) {
        return report(opts.error);
    }
    if (opts.value.help) {
        print_help();
        return 0;
    }

    // --verbose lasts for this command only
    bool echo_before = log_echo_enabled();
    if (opts.value.verbose) {
        set_log_echo(true);
    }

    forge_log(fmt::format("command '{}' ({} args)", command, args.size()));
    int code;
    try {
        code = it->second.first(*this, opts.value);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        forge_log(fmt::format("command '{}' threw: {}", command, e.what()));
        code = EXIT_GENERIC_FAILURE;
    }
    set_log_echo(echo_before);
    return code;
}

void BaseCLI::print_help() const {
    // Group commands by category
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Pipeline",    {"generate", "build", "run", "build-run"}},
        {"Presets",     {"list", "show"}},
        {"Environment", {"spinup", "setup"}},
        {"General",     {"help"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        bool has_any = false;
        for (const auto& name : cmd_names) {
            if (commands_.count(name)) {
                has_any = true;
                break;
            }
        }
        if (!has_any) continue;

        std::cout << "\n" << theme::color::ORANGE << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::command_row(name, it->second.second);
            }
        }
    }

    std::cout << "\n" << theme::color::DIM
              << "    Options: --preset <name>  --executable <path>  --export-compile-commands\n"
              << "             --presets-file <path>  --kind <kind>  --verbose  -- <program args>"
              << theme::color::RESET << "\n\n";
}
