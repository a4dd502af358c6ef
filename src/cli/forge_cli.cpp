#include "forge_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <iostream>

ForgeCLI::ForgeCLI() : BaseCLI() {
    register_all_commands();
}

void ForgeCLI::register_all_commands() {
    add_command("help", [this](BaseCLI& cli, const CommandOptions& opts) {
        this->print_usage();
        return 0;
    }, "Show this help message");

    register_pipeline_commands(*this);
    register_preset_commands(*this);
    register_environment_commands(*this);
}

void ForgeCLI::print_usage() const {
    std::cout << theme::banner(CPPFORGE_VERSION);
    std::cout << theme::section("Usage");
    std::cout << theme::color::STEEL << "    cppforge "
              << theme::color::RESET << theme::color::ORANGE << "<command>"
              << theme::color::RESET << theme::color::DIM << " [options]"
              << theme::color::RESET << "\n";
    print_help();
    std::cout << theme::color::DIM
              << "    cppforge --version    Show version\n"
              << "    cppforge --help       Show this help"
              << theme::color::RESET << "\n\n";
}

int ForgeCLI::run(const std::vector<std::string>& argv) {
    // Leading global options, then the command name
    std::vector<std::string> global;
    size_t i = 0;
    while (i < argv.size() && argv[i].rfind("-", 0) == 0) {
        const std::string& arg = argv[i];
        if (arg == "--version") {
            std::cout << theme::color::ORANGE << theme::color::BOLD << "cppforge"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << CPPFORGE_VERSION << theme::color::RESET << "\n";
            return 0;
        }
        if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        }
        global.push_back(arg);
        if (option_takes_value(arg) && i + 1 < argv.size()) {
            global.push_back(argv[++i]);
        }
        ++i;
    }

    if (i == argv.size()) {
        print_usage();
        return EXIT_USAGE;
    }

    const std::string& command = argv[i];
    if (!has_command(command)) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Run 'cppforge help' for available commands.");
        return EXIT_USAGE;
    }

    std::vector<std::string> args(global);
    args.insert(args.end(), argv.begin() + i + 1, argv.end());
    return execute_command(command, args);
}
