#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <filesystem>
#include <core/types.hpp>
#include <core/config.hpp>
#include <presets/preset.hpp>
#include <presets/expander.hpp>
#include <presets/resolved_configuration.hpp>
#include "executor.hpp"

enum class Verb { Generate, Build, Run, BuildRun };
enum class Step { Configure, Build, Run };

const char* verb_name(Verb verb);
std::optional<Verb> parse_verb(const std::string& text);
const char* step_name(Step step);

// generate -> Configure, build -> Build, run -> Run, build-run -> Build, Run
std::vector<Step> steps_for(Verb verb);

struct PipelineRequest {
    Verb verb = Verb::Generate;
    std::string preset;
    bool export_compile_commands = false;     // Configure only
    std::string executable;                   // Run: overrides targetExecutable
    std::vector<std::string> run_args;        // Run: everything after "--"
};

// Everything the steps of one command need, resolved up front.
struct PipelinePlan {
    ResolvedConfiguration configure;
    std::optional<ResolvedConfiguration> build;   // when a build preset was selected
    std::optional<ResolvedConfiguration> run;     // test preset of the same name, Run step only

    std::filesystem::path source_dir;
    std::filesystem::path binary_dir;
    std::string generator;
    std::map<std::string, std::string> environment;   // full child environment (run adds its own)
};

// First project() name in a CMakeLists.txt, or "" when there is none.
std::string read_project_name(const std::filesystem::path& cmake_lists);

// Maps a verb onto configure/build/run steps and runs them in order,
// stopping at the first precondition failure, launch failure or non-zero
// exit. Each step's precondition is checked right before the step runs,
// so build-run looks for the executable only after the build produced it.
class PipelineOrchestrator {
public:
    PipelineOrchestrator(const Config& config, const PresetDocument& document,
                         HostEnvironment host, CommandRunner& runner,
                         StatusCallback status = nullptr);

    Result<void> execute(const PipelineRequest& request);

    // Select, merge and expand the presets a verb runs against.
    Result<PipelinePlan> plan(Verb verb, const std::string& preset) const;

    // Command lines for each step.
    Invocation configure_invocation(const PipelinePlan& plan, bool export_compile_commands) const;
    Invocation build_invocation(const PipelinePlan& plan) const;
    Result<Invocation> run_invocation(const PipelinePlan& plan,
                                      const PipelineRequest& request) const;

private:
    Result<std::filesystem::path> locate_executable(const PipelinePlan& plan,
                                                    const PipelineRequest& request) const;
    Result<void> check_precondition(Step step, const PipelinePlan& plan,
                                    const PipelineRequest& request) const;
    Result<void> run_step(Step step, const PipelinePlan& plan, const Invocation& invocation);

    void status(const std::string& msg) const { if (status_) status_(msg); }

    const Config& config_;
    const PresetDocument& document_;
    HostEnvironment host_;
    CommandRunner& runner_;
    StatusCallback status_;
};
