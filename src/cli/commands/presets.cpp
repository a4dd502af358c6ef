#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <cctype>
#include <fmt/format.h>
#include <core/utils.hpp>
#include <presets/expander.hpp>
#include <presets/resolver.hpp>

static void print_preset_list(const PresetDocument& doc, PresetKind kind, bool explicit_kind) {
    std::vector<const Preset*> visible;
    for (const auto& preset : doc.presets(kind)) {
        if (!preset.hidden) visible.push_back(&preset);
    }

    if (visible.empty()) {
        if (explicit_kind) {
            std::cout << theme::info(fmt::format("No {} presets.", preset_kind_name(kind)));
        }
        return;
    }

    std::string title = preset_kind_name(kind);
    title[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(title[0])));
    std::cout << theme::section(title + " presets");
    for (const Preset* preset : visible) {
        std::cout << theme::command_row(preset->name, preset->display_name);
    }
}

static int do_list(BaseCLI& cli, const CommandOptions& opts) {
    if (!opts.preset.empty() || !opts.executable.empty() || !opts.passthrough.empty()) {
        return cli.report(make_error(ErrorKind::UsageError, "list only takes --kind"));
    }

    auto cfg = cli.ensure_config();
    if (cfg.is_err()) return cli.report(cfg.error);

    auto document = cli.load_presets(opts);
    if (document.is_err()) return cli.report(document.error);

    if (opts.kind) {
        print_preset_list(document.value, *opts.kind, true);
    } else {
        for (PresetKind kind : {PresetKind::Configure, PresetKind::Build, PresetKind::Test}) {
            print_preset_list(document.value, kind, false);
        }
    }
    std::cout << "\n";
    return 0;
}

static void print_optional(const char* key, const std::optional<std::string>& value) {
    if (value) std::cout << theme::kv(key, *value);
}

static int do_show(BaseCLI& cli, const CommandOptions& opts) {
    if (opts.preset.empty()) {
        return cli.report(make_error(ErrorKind::UsageError, "show needs --preset <name>"));
    }

    auto cfg = cli.ensure_config();
    if (cfg.is_err()) return cli.report(cfg.error);

    auto document = cli.load_presets(opts);
    if (document.is_err()) return cli.report(document.error);
    const PresetDocument& doc = document.value;

    PresetKind kind = opts.kind.value_or(PresetKind::Configure);
    MacroExpander expander(cli.host, doc.source_dir());
    PresetResolver resolver(doc, expander);

    auto merged = resolver.select(kind, opts.preset);
    if (merged.is_err()) return cli.report(merged.error);
    auto resolved = expander.expand(merged.value);
    if (resolved.is_err()) return cli.report(resolved.error);
    const ResolvedConfiguration& r = resolved.value;

    std::cout << theme::section(fmt::format("{} preset '{}'", preset_kind_name(kind), r.preset_name));
    if (!r.display_name.empty()) std::cout << theme::kv("displayName", r.display_name);
    if (!r.description.empty()) std::cout << theme::kv("description", r.description);
    print_optional("generator", r.generator);
    print_optional("binaryDir", r.binary_dir);
    print_optional("installDir", r.install_dir);
    print_optional("toolchainFile", r.toolchain_file);
    print_optional("targetExecutable", r.target_executable);
    print_optional("configurePreset", r.configure_preset);
    print_optional("configuration", r.configuration);
    if (!r.targets.empty()) std::cout << theme::kv("targets", join(r.targets));
    if (r.jobs) std::cout << theme::kv("jobs", std::to_string(*r.jobs));

    if (!r.cache_variables.empty()) {
        std::cout << "\n" << theme::dim("    cacheVariables") << "\n";
        for (const auto& [name, var] : r.cache_variables) {
            std::string key = var.type.empty() ? name : name + ":" + var.type;
            std::cout << theme::kv("  " + key, var.value);
        }
    }
    if (!r.environment.empty() || !r.unset_environment.empty()) {
        std::cout << "\n" << theme::dim("    environment") << "\n";
        for (const auto& [name, value] : r.environment) {
            std::cout << theme::kv("  " + name, value);
        }
        for (const auto& name : r.unset_environment) {
            std::cout << theme::kv("  " + name, theme::dim("(unset)"));
        }
    }
    std::cout << "\n";
    return 0;
}

void register_preset_commands(BaseCLI& cli) {
    cli.add_command("list", do_list, "List selectable presets");
    cli.add_command("show", do_show, "Show a preset after inheritance and expansion");
}
