//! # Talk++ Lexer
//!
//! This module implements the lexical analyzer for Talk++. The lexer turns
//! program text into a classified token sequence for the parser.
//!
//! ## Features
//!
//! - **Whole-word keywords**: Keywords and verbs are recognized only when the
//!   complete word matches, so `sender` stays an identifier
//! - **Two string forms**: `"..."` and `` `...` `` with backslash escapes
//! - **Comments**: `// line` and `/* block */` are skipped
//!
//! ## Error Handling
//!
//! Tokenization stops at the first invalid input and reports a
//! `LexicalError` with the byte offset of the offending text.
//!
//! ## Example
//!
//! ```cpp
//! Source source = Source::from_string("when user registers then send welcome_email");
//! Lexer lexer(source);
//! auto result = lexer.tokenize();
//! if (is_ok(result)) {
//!     for (const auto& token : unwrap(result)) { ... }
//! }
//! ```

#ifndef TALKPP_LEXER_LEXER_HPP
#define TALKPP_LEXER_LEXER_HPP

#include "common.hpp"
#include "error.hpp"
#include "lexer/source.hpp"
#include "lexer/token.hpp"

#include <optional>
#include <vector>

namespace talkpp::lexer {

/// Lexical analyzer for Talk++ source text.
///
/// The lexer holds a reference to its `Source`; the source must outlive it.
/// Tokens own their text, so the token sequence may outlive both.
class Lexer {
public:
    explicit Lexer(const Source& source);

    /// Tokenizes the entire source, stopping at the first error.
    [[nodiscard]] auto tokenize() -> Result<std::vector<Token>, LexicalError>;

    /// Lexes the next token. Returns `std::nullopt` at end of input.
    [[nodiscard]] auto next_token() -> Result<std::optional<Token>, LexicalError>;

private:
    // ========================================================================
    // State
    // ========================================================================

    const Source& source_;
    size_t pos_ = 0;         ///< Current byte position in source.
    size_t token_start_ = 0; ///< Start position of current token.

    /// Line and column of the furthest offset a token has reached. Only moves
    /// forward, so each byte is counted once.
    SourceLocation cursor_{};

    // ========================================================================
    // Character Access
    // ========================================================================

    [[nodiscard]] auto peek() const -> char;

    [[nodiscard]] auto peek_next() const -> char;

    auto advance() -> char;

    [[nodiscard]] auto is_at_end() const -> bool;

    // ========================================================================
    // Token Creation
    // ========================================================================

    /// Creates a token spanning `token_start_..pos_`.
    [[nodiscard]] auto make_token(TokenKind kind) -> Token;

    /// Moves `cursor_` forward to `offset` and returns its location.
    auto advance_cursor(size_t offset) -> SourceLocation;

    /// Creates an error at `position` with the given message.
    [[nodiscard]] auto make_error(size_t position, std::string message) const -> LexicalError;

    /// Creates an "Invalid token" error for the character at `token_start_`.
    [[nodiscard]] auto invalid_token_error() const -> LexicalError;

    // ========================================================================
    // Whitespace and Comments
    // ========================================================================

    /// Skips whitespace and comments. Fails on an unterminated block comment.
    [[nodiscard]] auto skip_trivia() -> std::optional<LexicalError>;

    void skip_line_comment();

    /// Returns false if the comment runs to end of input.
    [[nodiscard]] auto skip_block_comment() -> bool;

    // ========================================================================
    // Token Lexers
    // ========================================================================

    [[nodiscard]] auto lex_word() -> Token;

    [[nodiscard]] auto lex_service() -> Token;

    [[nodiscard]] auto lex_number() -> Result<Token, LexicalError>;

    [[nodiscard]] auto lex_string(char quote) -> Result<Token, LexicalError>;

    [[nodiscard]] auto lex_punctuation() -> Result<Token, LexicalError>;
};

/// Returns true for `[a-z_]`.
[[nodiscard]] auto is_identifier_start(char c) -> bool;

/// Returns true for `[a-zA-Z0-9_]`.
[[nodiscard]] auto is_identifier_continue(char c) -> bool;

/// Returns true for `[A-Z]`.
[[nodiscard]] auto is_service_start(char c) -> bool;

/// Tokenizes a program held in memory.
[[nodiscard]] auto tokenize(std::string_view text) -> Result<std::vector<Token>, CompilerError>;

} // namespace talkpp::lexer

#endif // TALKPP_LEXER_LEXER_HPP
