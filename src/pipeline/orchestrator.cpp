#include "orchestrator.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <presets/resolver.hpp>
#include <fmt/format.h>
#include <fstream>
#include <sstream>
#include <regex>

namespace fs = std::filesystem;

const char* verb_name(Verb verb) {
    switch (verb) {
        case Verb::Generate: return "generate";
        case Verb::Build:    return "build";
        case Verb::Run:      return "run";
        case Verb::BuildRun: return "build-run";
    }
    return "unknown";
}

std::optional<Verb> parse_verb(const std::string& text) {
    if (text == "generate")  return Verb::Generate;
    if (text == "build")     return Verb::Build;
    if (text == "run")       return Verb::Run;
    if (text == "build-run") return Verb::BuildRun;
    return std::nullopt;
}

const char* step_name(Step step) {
    switch (step) {
        case Step::Configure: return "configure";
        case Step::Build:     return "build";
        case Step::Run:       return "run";
    }
    return "unknown";
}

std::vector<Step> steps_for(Verb verb) {
    switch (verb) {
        case Verb::Generate: return {Step::Configure};
        case Verb::Build:    return {Step::Build};
        case Verb::Run:      return {Step::Run};
        case Verb::BuildRun: return {Step::Build, Step::Run};
    }
    return {};
}

std::string read_project_name(const fs::path& cmake_lists) {
    std::ifstream in(cmake_lists);
    if (!in) return "";

    // Drop line comments so a commented-out project() is not picked up
    std::ostringstream text;
    std::string line;
    while (std::getline(in, line)) {
        auto hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        text << line << '\n';
    }

    static const std::regex project_re(R"(project\s*\(\s*"?([A-Za-z0-9_.+-]+))",
                                       std::regex::icase);
    std::smatch m;
    std::string body = text.str();
    if (std::regex_search(body, m, project_re)) {
        return m[1].str();
    }
    return "";
}

namespace {

// Relative preset paths are anchored at the source directory.
fs::path anchor(const fs::path& source_dir, const std::string& path) {
    fs::path p(path);
    if (p.is_relative()) p = source_dir / p;
    return p.lexically_normal();
}

void apply_environment(std::map<std::string, std::string>& env,
                       const ResolvedConfiguration& config) {
    for (const auto& name : config.unset_environment) {
        env.erase(name);
    }
    for (const auto& [name, value] : config.environment) {
        env[name] = value;
    }
}

const std::string& selected_name(const PipelinePlan& plan) {
    return plan.build ? plan.build->preset_name : plan.configure.preset_name;
}

const std::string& step_preset_name(const PipelinePlan& plan, Step step) {
    if (step == Step::Run && plan.run) return plan.run->preset_name;
    return selected_name(plan);
}

} // namespace

PipelineOrchestrator::PipelineOrchestrator(const Config& config, const PresetDocument& document,
                                           HostEnvironment host, CommandRunner& runner,
                                           StatusCallback status)
    : config_(config), document_(document), host_(std::move(host)),
      runner_(runner), status_(std::move(status)) {}

Result<PipelinePlan> PipelineOrchestrator::plan(Verb verb, const std::string& preset) const {
    MacroExpander expander(host_, document_.source_dir());
    PresetResolver resolver(document_, expander);

    auto expand_preset = [&](PresetKind kind, const std::string& name,
                             bool selected) -> Result<ResolvedConfiguration> {
        auto merged = selected ? resolver.select(kind, name) : resolver.resolve(kind, name);
        if (merged.is_err()) return Result<ResolvedConfiguration>::Err(merged.error);
        return expander.expand(merged.value);
    };

    // Build and test presets point at the configure preset that owns the tree.
    auto expand_configure_of = [&](const ResolvedConfiguration& owner)
        -> Result<ResolvedConfiguration> {
        const auto& configure_name = owner.configure_preset;
        if (!configure_name || configure_name->empty()) {
            return Result<ResolvedConfiguration>::Err(make_error(
                ErrorKind::SchemaViolation,
                fmt::format("{} preset does not name a configurePreset", preset_kind_name(owner.kind)),
                owner.preset_name, "configurePreset"));
        }

        auto configure = expand_preset(PresetKind::Configure, *configure_name, false);
        if (configure.is_err()) {
            Error e = configure.error;
            if (e.kind == ErrorKind::PresetNotFound && e.field.empty()) {
                e = make_error(ErrorKind::PresetNotFound,
                               fmt::format("refers to unknown configure preset '{}'", *configure_name),
                               owner.preset_name, "configurePreset", *configure_name);
            }
            return Result<ResolvedConfiguration>::Err(e);
        }
        return configure;
    };

    PipelinePlan plan;
    plan.source_dir = document_.source_dir();

    bool runs = verb == Verb::Run || verb == Verb::BuildRun;
    if (runs && document_.find(PresetKind::Test, preset)) {
        auto run = expand_preset(PresetKind::Test, preset, true);
        if (run.is_err()) return Result<PipelinePlan>::Err(run.error);
        plan.run = run.value;
    }

    if (verb != Verb::Generate && document_.find(PresetKind::Build, preset)) {
        auto build = expand_preset(PresetKind::Build, preset, true);
        if (build.is_err()) return Result<PipelinePlan>::Err(build.error);
        plan.build = build.value;
    }

    if (plan.build || plan.run) {
        const ResolvedConfiguration& owner = plan.build ? *plan.build : *plan.run;
        auto configure = expand_configure_of(owner);
        if (configure.is_err()) return Result<PipelinePlan>::Err(configure.error);
        plan.configure = configure.value;

        if (plan.build && plan.run) {
            if (!plan.run->configure_preset || plan.run->configure_preset->empty()) {
                return Result<PipelinePlan>::Err(make_error(
                    ErrorKind::SchemaViolation, "test preset does not name a configurePreset",
                    plan.run->preset_name, "configurePreset"));
            }
            if (*plan.run->configure_preset != plan.configure.preset_name) {
                return Result<PipelinePlan>::Err(make_error(
                    ErrorKind::SchemaViolation,
                    fmt::format("uses configure preset '{}' but the build preset uses '{}'",
                                *plan.run->configure_preset, plan.configure.preset_name),
                    plan.run->preset_name, "configurePreset", *plan.run->configure_preset));
            }
        }
    } else {
        auto configure = expand_preset(PresetKind::Configure, preset, true);
        if (configure.is_err()) return Result<PipelinePlan>::Err(configure.error);
        plan.configure = configure.value;
    }

    plan.generator = plan.configure.generator.value_or(config_.default_generator());
    plan.binary_dir = plan.configure.binary_dir
        ? anchor(plan.source_dir, *plan.configure.binary_dir)
        : (plan.source_dir / DEFAULT_BINARY_DIR).lexically_normal();

    plan.environment = host_.variables;
    apply_environment(plan.environment, plan.configure);
    if (plan.build) apply_environment(plan.environment, *plan.build);

    forge_log(fmt::format("plan {} '{}': configure='{}' generator='{}' binaryDir='{}'",
                          verb_name(verb), preset, plan.configure.preset_name,
                          plan.generator, plan.binary_dir.string()));
    return Result<PipelinePlan>::Ok(plan);
}

Invocation PipelineOrchestrator::configure_invocation(const PipelinePlan& plan,
                                                      bool export_compile_commands) const {
    const ResolvedConfiguration& cfg = plan.configure;

    Invocation inv;
    inv.program = CMAKE_PROGRAM;
    inv.working_dir = plan.source_dir.string();
    inv.environment = plan.environment;
    inv.args = {"-S", plan.source_dir.string(), "-B", plan.binary_dir.string(),
                "-G", plan.generator};

    if (cfg.toolchain_file) {
        inv.args.push_back("-DCMAKE_TOOLCHAIN_FILE=" +
                           anchor(plan.source_dir, *cfg.toolchain_file).string());
    }
    if (cfg.install_dir) {
        inv.args.push_back("-DCMAKE_INSTALL_PREFIX=" +
                           anchor(plan.source_dir, *cfg.install_dir).string());
    }
    for (const auto& [name, var] : cfg.cache_variables) {
        if (var.type.empty()) {
            inv.args.push_back(fmt::format("-D{}={}", name, var.value));
        } else {
            inv.args.push_back(fmt::format("-D{}:{}={}", name, var.type, var.value));
        }
    }
    if (export_compile_commands) {
        inv.args.push_back("-DCMAKE_EXPORT_COMPILE_COMMANDS=ON");
    }
    return inv;
}

Invocation PipelineOrchestrator::build_invocation(const PipelinePlan& plan) const {
    Invocation inv;
    inv.program = CMAKE_PROGRAM;
    inv.working_dir = plan.source_dir.string();
    inv.environment = plan.environment;
    inv.args = {"--build", plan.binary_dir.string()};

    if (plan.build) {
        const ResolvedConfiguration& b = *plan.build;
        if (b.configuration) {
            inv.args.push_back("--config");
            inv.args.push_back(*b.configuration);
        }
        if (b.jobs && *b.jobs > 0) {
            inv.args.push_back("--parallel");
            inv.args.push_back(std::to_string(*b.jobs));
        }
        if (!b.targets.empty()) {
            inv.args.push_back("--target");
            inv.args.insert(inv.args.end(), b.targets.begin(), b.targets.end());
        }
    }
    return inv;
}

Result<fs::path> PipelineOrchestrator::locate_executable(const PipelinePlan& plan,
                                                         const PipelineRequest& request) const {
    const std::string& preset = step_preset_name(plan, Step::Run);

    std::string candidate;
    std::string field = "targetExecutable";
    if (!request.executable.empty()) {
        candidate = request.executable;
        field = "executable";
    } else if (plan.run && plan.run->target_executable) {
        candidate = *plan.run->target_executable;
    } else if (plan.build && plan.build->target_executable) {
        candidate = *plan.build->target_executable;
    } else if (plan.configure.target_executable) {
        candidate = *plan.configure.target_executable;
    } else {
        std::string project = read_project_name(plan.source_dir / "CMakeLists.txt");
        if (project.empty()) {
            return Result<fs::path>::Err(make_error(
                ErrorKind::PreconditionFailed,
                "cannot tell which executable to run: no targetExecutable and no project() "
                "in CMakeLists.txt (pass --executable)",
                preset, field));
        }
        candidate = (plan.binary_dir / project).string();
    }

    fs::path path(candidate);
    std::vector<fs::path> tries;
    if (path.is_absolute()) {
        tries.push_back(path);
    } else {
        tries.push_back(fs::current_path() / path);
        tries.push_back(plan.binary_dir / path);
    }

    for (const auto& t : tries) {
        std::error_code ec;
        if (fs::is_regular_file(t, ec)) {
            return Result<fs::path>::Ok(t.lexically_normal());
        }
    }

    return Result<fs::path>::Err(make_error(
        ErrorKind::PreconditionFailed,
        fmt::format("executable '{}' does not exist (build it first)", candidate),
        preset, field, candidate));
}

Result<Invocation> PipelineOrchestrator::run_invocation(const PipelinePlan& plan,
                                                        const PipelineRequest& request) const {
    auto exe = locate_executable(plan, request);
    if (exe.is_err()) return Result<Invocation>::Err(exe.error);

    Invocation inv;
    inv.program = exe.value.string();
    inv.args = request.run_args;
    inv.environment = plan.environment;
    if (plan.run) apply_environment(inv.environment, *plan.run);
    return Result<Invocation>::Ok(inv);
}

Result<void> PipelineOrchestrator::check_precondition(Step step, const PipelinePlan& plan,
                                                      const PipelineRequest& request) const {
    switch (step) {
        case Step::Configure:
            return Result<void>::Ok();

        case Step::Build: {
            std::error_code ec;
            if (!fs::is_directory(plan.binary_dir, ec)) {
                return Result<void>::Err(make_error(
                    ErrorKind::PreconditionFailed,
                    fmt::format("binary directory '{}' does not exist; run "
                                "'cppforge generate --preset {}' first",
                                plan.binary_dir.string(), plan.configure.preset_name),
                    selected_name(plan), "binaryDir"));
            }
            return Result<void>::Ok();
        }

        case Step::Run: {
            auto exe = locate_executable(plan, request);
            if (exe.is_err()) return Result<void>::Err(exe.error);
            return Result<void>::Ok();
        }
    }
    return Result<void>::Ok();
}

Result<void> PipelineOrchestrator::run_step(Step step, const PipelinePlan& plan,
                                            const Invocation& invocation) {
    const std::string& preset = step_preset_name(plan, step);
    status(fmt::format("{}: {}", step_name(step),
                       format_command(invocation.program, invocation.args)));

    auto result = runner_.run(invocation);
    if (result.is_err()) {
        Error e = result.error;
        e.preset = preset;
        e.field = step_name(step);
        return Result<void>::Err(e);
    }

    int code = result.value;
    if (code != 0) {
        Error e = make_error(ErrorKind::StepFailed,
                             fmt::format("{} step exited with status {}", step_name(step), code),
                             preset, step_name(step));
        e.exit_code = code > 0 ? code : EXIT_GENERIC_FAILURE;
        return Result<void>::Err(e);
    }
    return Result<void>::Ok();
}

Result<void> PipelineOrchestrator::execute(const PipelineRequest& request) {
    auto planned = plan(request.verb, request.preset);
    if (planned.is_err()) return Result<void>::Err(planned.error);
    const PipelinePlan& p = planned.value;

    for (Step step : steps_for(request.verb)) {
        auto ready = check_precondition(step, p, request);
        if (ready.is_err()) {
            forge_log(fmt::format("{} precondition failed: {}", step_name(step),
                                  ready.error.message));
            return ready;
        }

        Invocation inv;
        switch (step) {
            case Step::Configure:
                inv = configure_invocation(p, request.export_compile_commands);
                break;
            case Step::Build:
                inv = build_invocation(p);
                break;
            case Step::Run: {
                auto run = run_invocation(p, request);
                if (run.is_err()) return Result<void>::Err(run.error);
                inv = run.value;
                break;
            }
        }

        auto done = run_step(step, p, inv);
        if (done.is_err()) {
            forge_log(fmt::format("pipeline {} halted at {}: {}", verb_name(request.verb),
                                  step_name(step), done.error.describe()));
            return done;
        }
    }

    forge_log(fmt::format("pipeline {} '{}' complete", verb_name(request.verb), request.preset));
    return Result<void>::Ok();
}
