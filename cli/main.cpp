//
// Created by gregorian-rayne on 10/18/26.
//

#include "aua/cli/commands/command.hpp"
#include "aua/version.hpp"

#include <exception>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace {

    void print_usage() {
        std::cout << aua::PROJECT_NAME << " " << aua::VERSION_STRING << "\n\n";
        std::cout << "Usage: " << aua::PROJECT_SHORT_NAME << " <command> [OPTIONS]\n\n";
        std::cout << "Commands:\n";
        for (const auto* command : aua::cli::CommandRegistry::instance().list()) {
            std::cout << "  " << std::left << std::setw(12) << command->name() << command->description() << "\n";
        }
        std::cout << "\nRun '" << aua::PROJECT_SHORT_NAME << " <command> --help' for command options.\n";
    }

}  // namespace

int main(const int argc, char** argv) {
    const std::vector<std::string> args(argv + 1, argv + argc);

    if (args.empty()) {
        print_usage();
        return 1;
    }

    const std::string& command_name = args.front();
    if (command_name == "--help" || command_name == "-h" || command_name == "help") {
        print_usage();
        return 0;
    }
    if (command_name == "--version" || command_name == "version") {
        std::cout << aua::PROJECT_SHORT_NAME << " " << aua::VERSION_STRING << "\n";
        return 0;
    }

    auto* command = aua::cli::CommandRegistry::instance().find(command_name);
    if (command == nullptr) {
        std::cerr << "error: unknown command '" << command_name << "'\n\n";
        print_usage();
        return 1;
    }

    try {
        const std::vector<std::string> command_args(args.begin() + 1, args.end());
        auto parsed = aua::cli::parse_arguments(command_args, command->arguments());
        if (!parsed.success) {
            std::cerr << "error: " << parsed.error << "\n";
            return 1;
        }

        if (parsed.args.get_flag("help")) {
            command->print_help();
            return 0;
        }

        if (const auto problem = command->validate(parsed.args); !problem.empty()) {
            std::cerr << "error: " << problem << "\n\n" << command->usage() << "\n";
            return 1;
        }

        return command->execute(parsed.args);

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
