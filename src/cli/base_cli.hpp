#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <core/config.hpp>
#include <core/types.hpp>
#include <presets/preset.hpp>
#include <presets/expander.hpp>
#include <pipeline/executor.hpp>

// Options shared by every command. Each command decides which of them
// it accepts.
struct CommandOptions {
    std::string preset;                         // --preset
    std::string executable;                     // --executable
    bool export_compile_commands = false;       // --export-compile-commands
    std::string presets_file;                   // --presets-file
    std::optional<PresetKind> kind;             // --kind
    bool verbose = false;                       // --verbose
    bool help = false;                          // -h, --help
    std::vector<std::string> passthrough;       // everything after "--"
};

// Fails with UsageError on unknown options, missing values and stray
// positional arguments. Values may be given as "--opt value" or "--opt=value".
Result<CommandOptions> parse_command_options(const std::vector<std::string>& args);

// True for options written "--opt value" (the value is the next argument).
bool option_takes_value(const std::string& name);

class BaseCLI {
public:
    BaseCLI();
    virtual ~BaseCLI() = default;

    using CommandHandler = std::function<int(BaseCLI&, const CommandOptions&)>;

    void add_command(const std::string& name,
                     CommandHandler handler,
                     const std::string& help);
    bool has_command(const std::string& name) const;

    // Parse options and dispatch. Returns the process exit code.
    int execute_command(const std::string& command, const std::vector<std::string>& args);
    void print_help() const;

    // Load cppforge.yaml layers unless a config is already present.
    Result<void> ensure_config();

    // Presets file from --presets-file, else from the config.
    std::filesystem::path presets_path(const CommandOptions& opts) const;
    Result<PresetDocument> load_presets(const CommandOptions& opts) const;

    // Print one red line for the error and return the exit code it maps to.
    int report(const Error& error) const;

    // Progress lines from library code.
    StatusCallback status_printer() const;

    // Public state
    std::optional<Config> config;
    std::unique_ptr<CommandRunner> runner;
    HostEnvironment host;

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
};

// Exit code for an error: the step's own status for StepFailed, 2 for
// usage errors, 1 otherwise.
int exit_code_for(const Error& error);
