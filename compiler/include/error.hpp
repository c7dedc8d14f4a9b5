//! # Compiler Errors
//!
//! This module defines the single error type returned by every pipeline
//! stage. A `CompilerError` is a closed set of alternatives; each carries the
//! data its stage knows about the failure.
//!
//! ## Error Kinds
//!
//! | Kind                 | Payload                 | Raised by      |
//! |----------------------|-------------------------|----------------|
//! | `LexicalError`       | byte position, message  | lexer          |
//! | `ParseError`         | line, column, message   | parser         |
//! | `SemanticError`      | message                 | reserved       |
//! | `CodeGenError`       | message                 | code generator |
//! | `UnsupportedFeature` | feature name            | code generator |
//! | `InternalError`      | message                 | any stage      |
//! | `IoError`            | path, message           | driver, CLI    |
//!
//! ## Display
//!
//! `to_string()` renders the canonical one-line message, for example
//! `Parse error at line 1, column 23: Expected 'then' after condition`.

#ifndef TALKPP_ERROR_HPP
#define TALKPP_ERROR_HPP

#include "common.hpp"

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace talkpp {

/// Invalid input at a byte position.
struct LexicalError {
    size_t position = 0; ///< 0-based byte offset of the offending text.
    std::string message;
};

/// Token sequence not matching the grammar.
struct ParseError {
    uint32_t line = 1;   ///< 1-based line.
    uint32_t column = 1; ///< 1-based column.
    std::string message;
};

/// Reserved for semantic checks over a parsed program.
struct SemanticError {
    std::string message;
};

/// Failure while producing target text.
struct CodeGenError {
    std::string message;
};

/// A construct that parses but cannot be generated.
struct UnsupportedFeature {
    std::string feature;
};

/// Compiler bug.
struct InternalError {
    std::string message;
};

/// File system failure in a caller of the pipeline.
struct IoError {
    std::string path;
    std::string message;
};

/// Discriminator mirroring the `CompilerError` alternatives.
enum class ErrorKind {
    Lexical,
    Parse,
    Semantic,
    CodeGen,
    Unsupported,
    Internal,
    Io,
};

/// Short lowercase name of an error kind (e.g. "parse error").
[[nodiscard]] auto error_kind_name(ErrorKind kind) -> std::string_view;

/// The error type shared by the lexer, parser, code generator and driver.
struct CompilerError {
    using Kind = std::variant<LexicalError, ParseError, SemanticError, CodeGenError,
                              UnsupportedFeature, InternalError, IoError>;

    Kind kind;

    CompilerError(LexicalError e) : kind(std::move(e)) {}
    CompilerError(ParseError e) : kind(std::move(e)) {}
    CompilerError(SemanticError e) : kind(std::move(e)) {}
    CompilerError(CodeGenError e) : kind(std::move(e)) {}
    CompilerError(UnsupportedFeature e) : kind(std::move(e)) {}
    CompilerError(InternalError e) : kind(std::move(e)) {}
    CompilerError(IoError e) : kind(std::move(e)) {}

    /// Checks if this error holds alternative `T`.
    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    /// Gets the alternative as `T`. Throws if the alternative differs.
    template <typename T> [[nodiscard]] auto as() const -> const T& {
        return std::get<T>(kind);
    }

    /// Returns the discriminator for this error.
    [[nodiscard]] auto error_kind() const -> ErrorKind;

    /// Returns the bare message without the kind prefix.
    [[nodiscard]] auto message() const -> std::string;

    /// Returns line and column when the error carries them.
    [[nodiscard]] auto line_column() const -> std::optional<std::pair<uint32_t, uint32_t>>;
};

/// Renders the canonical display message for an error.
[[nodiscard]] auto to_string(const CompilerError& error) -> std::string;

} // namespace talkpp

#endif // TALKPP_ERROR_HPP
