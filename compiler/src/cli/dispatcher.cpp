//! # CLI Command Dispatcher
//!
//! This file implements the main entry point for the Talk++ compiler CLI.
//! It sets up logging, parses command-line arguments and routes to the
//! appropriate command handler.
//!
//! ## Architecture
//!
//! ```text
//! talkpp_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ info           → print_info()
//!   ├─ lex            → run_lex()
//!   ├─ parse          → run_parse()
//!   ├─ check          → run_check()
//!   └─ build          → run_build()
//! ```
//!
//! ## Global Flags
//!
//! Logging flags (`--log-level=`, `--log-filter=`, `--log-file=`,
//! `--log-format=`, `-q`, `-v`) are accepted by every command.

#include "cli/diagnostic.hpp"
#include "cli/driver.hpp"
#include "commands/cmd_build.hpp"
#include "commands/cmd_debug.hpp"
#include "common.hpp"
#include "log/log.hpp"
#include "utils.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace talkpp::cli {

namespace {

const std::vector<std::string>& command_names() {
    static const std::vector<std::string> names = {"build", "check", "lex", "parse", "info"};
    return names;
}

// First non-log argument after the command
std::string positional_arg(const std::vector<std::string>& args) {
    for (const auto& arg : args) {
        if (!talkpp::log::is_log_option(arg)) {
            return arg;
        }
    }
    return "";
}

} // anonymous namespace

} // namespace talkpp::cli

/// Main entry point for the Talk++ compiler CLI.
///
/// ## Return Codes
///
/// | Code | Meaning                                  |
/// |------|------------------------------------------|
/// | 0    | Success                                  |
/// | 1    | Error (usage, I/O, lex, parse, codegen)  |
int talkpp_main(int argc, char* argv[]) {
    using namespace talkpp;
    using namespace talkpp::cli;

    talkpp::log::Logger::init(talkpp::log::parse_log_options(argc, argv));

    if (argc < 2) {
        print_usage();
        return 0;
    }

    std::string command = argv[1];
    std::vector<std::string> args(argv + 2, argv + argc);

    if (command == "--help" || command == "-h") {
        print_usage();
        return 0;
    }

    if (command == "--version" || command == "-V") {
        print_version();
        return 0;
    }

    if (command == "info") {
        print_info();
        return 0;
    }

    if (command == "lex" || command == "parse") {
        auto path = positional_arg(args);
        if (path.empty()) {
            std::cerr << "Usage: talkppc " << command << " <file.tpp>\n";
            return 1;
        }
        return command == "lex" ? run_lex(path) : run_parse(path);
    }

    if (command == "build" || command == "check") {
        auto options = parse_build_args(args);
        if (is_err(options)) {
            get_diagnostic_emitter().error("", unwrap_err(options), "", std::nullopt);
            std::cerr << "Usage: talkppc " << command
                      << " <file.tpp> [--target=<lang>] [--output=<path>] "
                         "[--optimization=<level>] [--debug]\n";
            return 1;
        }
        return command == "build" ? run_build(unwrap(options)) : run_check(unwrap(options));
    }

    std::cerr << "Unknown command: " << command << "\n";
    auto suggestion = find_similar(command, command_names());
    if (!suggestion.empty()) {
        std::cerr << "Did you mean '" << suggestion << "'?\n";
    }
    std::cerr << "Run 'talkppc --help' for usage.\n";
    return 1;
}
