#pragma once

#include "base_cli.hpp"
#include <string>
#include <vector>

// Forward declarations for command registration
void register_pipeline_commands(BaseCLI& cli);
void register_preset_commands(BaseCLI& cli);
void register_environment_commands(BaseCLI& cli);

class ForgeCLI : public BaseCLI {
public:
    ForgeCLI();

    // Entry point for argv[1..]. Global options may come before the
    // command name ("cppforge --verbose build --preset dev").
    int run(const std::vector<std::string>& argv);

    void print_usage() const;

private:
    void register_all_commands();
};
