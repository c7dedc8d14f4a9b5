//! # Build Command Interface
//!
//! This header defines the build command API and its options.
//!
//! ## Build Functions
//!
//! | Function             | Description                               |
//! |----------------------|-------------------------------------------|
//! | `parse_build_args()` | Map command-line flags to `BuildOptions`  |
//! | `run_build()`        | Compile a source file to the target       |
//!
//! ## Exit Codes
//!
//! - `EXIT_SUCCESS_CODE (0)`: Success
//! - `EXIT_COMPILATION_ERROR (1)`: Any failure (I/O, lex, parse, codegen)

#pragma once
#include "codegen/target.hpp"
#include "common.hpp"

#include <string>
#include <vector>

namespace talkpp::cli {

constexpr int EXIT_SUCCESS_CODE = 0;
constexpr int EXIT_COMPILATION_ERROR = 1;

// Build options
struct BuildOptions {
    std::string input;
    std::string output; // Empty means input path with the target extension
    codegen::CodegenConfig config;
};

// Parses `build` arguments (everything after the command name). Log options
// are skipped. Returns an error message for unknown flags or values.
Result<BuildOptions, std::string> parse_build_args(const std::vector<std::string>& args);

// Build command
int run_build(const BuildOptions& options);

} // namespace talkpp::cli
