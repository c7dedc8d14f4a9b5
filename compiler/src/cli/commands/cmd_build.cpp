//! # Build Command
//!
//! This file implements `talkppc build`.
//!
//! ## Build Pipeline
//!
//! ```text
//! file ──► Source ──► Compiler::compile() ──► text ──► <output>.<ext>
//! ```
//!
//! ## Options
//!
//! | Flag                      | Effect                                |
//! |---------------------------|---------------------------------------|
//! | `--target=<lang>`         | Output language (default `rust`)      |
//! | `--output=<path>`, `-o`   | Output path                           |
//! | `--optimization=<level>`  | `debug`, `release` or `size`          |
//! | `--debug` / `--no-debug`  | Toggle the Rust bootstrap             |

#include "cmd_build.hpp"

#include "cli/diagnostic.hpp"
#include "cli/utils.hpp"
#include "driver/compiler.hpp"
#include "log/log.hpp"

#include <iostream>

namespace talkpp::cli {

namespace {

const std::vector<std::string>& target_names() {
    static const std::vector<std::string> names = {"rust", "python", "javascript", "typescript",
                                                   "bash"};
    return names;
}

std::string unknown_target_message(const std::string& name) {
    std::string message = "Unknown target language '" + name + "'";
    auto suggestion = find_similar(name, target_names());
    if (!suggestion.empty()) {
        message += " (did you mean '" + suggestion + "'?)";
    }
    return message;
}

} // anonymous namespace

Result<BuildOptions, std::string> parse_build_args(const std::vector<std::string>& args) {
    BuildOptions options;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (talkpp::log::is_log_option(arg)) {
            continue;
        }

        if (arg.starts_with("--target=")) {
            auto name = arg.substr(9);
            auto language = codegen::parse_target_language(name);
            if (!language) {
                return unknown_target_message(name);
            }
            options.config.target_language = *language;
        } else if (arg == "--target" || arg == "-t") {
            if (i + 1 >= args.size()) {
                return std::string("Missing value for " + arg);
            }
            auto name = args[++i];
            auto language = codegen::parse_target_language(name);
            if (!language) {
                return unknown_target_message(name);
            }
            options.config.target_language = *language;
        } else if (arg.starts_with("--output=")) {
            options.output = arg.substr(9);
        } else if (arg == "--output" || arg == "-o") {
            if (i + 1 >= args.size()) {
                return std::string("Missing value for " + arg);
            }
            options.output = args[++i];
        } else if (arg.starts_with("--optimization=")) {
            auto level = codegen::parse_optimization_level(arg.substr(15));
            if (!level) {
                return std::string("Unknown optimization level '" + arg.substr(15) + "'");
            }
            options.config.optimization_level = *level;
        } else if (arg == "--release") {
            options.config.optimization_level = codegen::OptimizationLevel::Release;
        } else if (arg == "--debug") {
            options.config.debug_mode = true;
        } else if (arg == "--no-debug") {
            options.config.debug_mode = false;
        } else if (arg.starts_with("-") && arg.size() > 1) {
            return std::string("Unknown option '" + arg + "'");
        } else if (options.input.empty()) {
            options.input = arg;
        } else {
            return std::string("Unexpected argument '" + arg + "'");
        }
    }

    if (options.input.empty()) {
        return std::string("Missing input file");
    }
    return options;
}

int run_build(const BuildOptions& options) {
    auto source = load_source(options.input);
    if (!source) {
        return EXIT_COMPILATION_ERROR;
    }

    TALKPP_LOG_INFO("build", "Compiling " << options.input << " for "
                                          << codegen::target_language_name(
                                                 options.config.target_language)
                                          << " ("
                                          << codegen::optimization_level_name(
                                                 options.config.optimization_level)
                                          << ")");

    Compiler compiler(options.config);
    auto program = compiler.parse(source->content());
    if (is_err(program)) {
        get_diagnostic_emitter().emit_compiler_error(options.input, unwrap_err(program));
        return EXIT_COMPILATION_ERROR;
    }
    warn_unregistered_services(options.input, unwrap(program));

    auto result = compiler.generate(unwrap(program));
    if (is_err(result)) {
        get_diagnostic_emitter().emit_compiler_error(options.input, unwrap_err(result));
        return EXIT_COMPILATION_ERROR;
    }

    auto output = options.output.empty()
                      ? default_output_path(options.input, options.config.target_language)
                      : options.output;

    if (auto err = write_file(output, unwrap(result))) {
        get_diagnostic_emitter().emit_compiler_error(options.input, CompilerError{*err});
        return EXIT_COMPILATION_ERROR;
    }

    std::cout << "Compiled " << options.input << " -> " << output;
    if (auto warnings = get_diagnostic_emitter().warning_count()) {
        std::cout << " (" << warnings << (warnings == 1 ? " warning" : " warnings") << ")";
    }
    std::cout << "\n";
    return EXIT_SUCCESS_CODE;
}

} // namespace talkpp::cli
