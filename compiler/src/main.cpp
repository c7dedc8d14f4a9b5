//! # Talk++ Compiler Entry Point
//!
//! This file is the main entry point for `talkppc`, the Talk++ compiler. It
//! delegates to the CLI driver which handles command parsing and execution.
//!
//! ## Usage
//!
//! ```bash
//! talkppc build rules.tpp --target=python   # Compile to rules.py
//! talkppc check rules.tpp                   # Validate without output
//! talkppc parse rules.tpp                   # Print the syntax tree
//! ```

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return talkpp_main(argc, argv);
}
