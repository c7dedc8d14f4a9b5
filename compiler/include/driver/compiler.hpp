//! # Compiler Facade
//!
//! One call from DSL source text to target source text:
//!
//! ```text
//! source ──► lexer::tokenize ──► parser::parse ──► codegen::generate ──► text
//! ```
//!
//! The first failing stage ends the pipeline and its error is returned
//! unchanged. Nothing is partially emitted.
//!
//! ## Example
//!
//! ```cpp
//! talkpp::Compiler compiler({.target_language = codegen::TargetLanguage::Python});
//! auto result = compiler.compile("send welcome message using Twilio");
//! if (is_ok(result)) {
//!     std::cout << unwrap(result);
//! }
//! ```

#ifndef TALKPP_DRIVER_COMPILER_HPP
#define TALKPP_DRIVER_COMPILER_HPP

#include "codegen/target.hpp"
#include "common.hpp"
#include "error.hpp"
#include "parser/ast.hpp"

#include <string>
#include <string_view>

namespace talkpp {

/// Runs the full pipeline for one configuration.
///
/// Holds only its configuration, so a single instance may be shared across
/// threads.
class Compiler {
public:
    explicit Compiler(codegen::CodegenConfig config = {});

    /// Compiles source text to target source text.
    [[nodiscard]] auto compile(std::string_view source) const -> Result<std::string, CompilerError>;

    /// Runs the full pipeline and returns the statement count instead of text.
    [[nodiscard]] auto check(std::string_view source) const -> Result<size_t, CompilerError>;

    /// Lexes and parses without generating code.
    [[nodiscard]] auto parse(std::string_view source) const
        -> Result<parser::Program, CompilerError>;

    /// Generates target text for an already parsed program.
    [[nodiscard]] auto generate(const parser::Program& program) const
        -> Result<std::string, CompilerError>;

    /// Generates and discards the text, returning the statement count.
    [[nodiscard]] auto check(const parser::Program& program) const
        -> Result<size_t, CompilerError>;

    [[nodiscard]] auto config() const -> const codegen::CodegenConfig& {
        return config_;
    }

private:
    codegen::CodegenConfig config_;
};

} // namespace talkpp

#endif // TALKPP_DRIVER_COMPILER_HPP
