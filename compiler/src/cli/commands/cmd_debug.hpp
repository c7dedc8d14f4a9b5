//! # Debug Commands Interface
//!
//! This header defines inspection commands for the compiler stages.
//!
//! ## Commands
//!
//! | Function       | Command           | Output                         |
//! |----------------|-------------------|--------------------------------|
//! | `run_lex()`    | `talkppc lex`     | Token stream                   |
//! | `run_parse()`  | `talkppc parse`   | Syntax tree                    |
//! | `run_check()`  | `talkppc check`   | Success or diagnostics only    |

#pragma once
#include "cmd_build.hpp"

#include <string>

namespace talkpp::cli {

// Debug commands
int run_lex(const std::string& path);
int run_parse(const std::string& path);

// Runs the whole pipeline for `options.config` without writing output
int run_check(const BuildOptions& options);

} // namespace talkpp::cli
