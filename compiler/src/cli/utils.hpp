//! # CLI Utilities Interface
//!
//! This header defines shared utility functions for the CLI.
//!
//! ## Functions
//!
//! | Function                       | Description                          |
//! |--------------------------------|--------------------------------------|
//! | `output_extension()`           | File extension for a target language |
//! | `default_output_path()`        | Input path with the target extension |
//! | `load_source()`                | Read a source file for a command     |
//! | `write_file()`                 | Write a whole file                   |
//! | `warn_unregistered_services()` | W001 for each unknown service        |
//! | `print_usage()`                | Print CLI help text                  |
//! | `print_version()`              | Print compiler version               |
//! | `print_info()`                 | Print targets and services           |

#pragma once
#include "codegen/target.hpp"
#include "common.hpp"
#include "error.hpp"
#include "lexer/source.hpp"
#include "parser/ast.hpp"

#include <optional>
#include <string>

namespace talkpp::cli {

// Output naming
std::string output_extension(codegen::TargetLanguage language);
std::string default_output_path(const std::string& input, codegen::TargetLanguage language);

// File I/O
// Reads `path` and registers it with the diagnostic emitter; reports and
// returns nullopt on failure
std::optional<lexer::Source> load_source(const std::string& path);
std::optional<IoError> write_file(const std::string& path, const std::string& content);

// Reports each service the registry does not know as a W001 warning; the
// generated code still compiles and logs a warning at that point
void warn_unregistered_services(const std::string& path, const parser::Program& program);

// Help text
void print_usage();
void print_version();
void print_info();

} // namespace talkpp::cli
