//! # Talk++ Tokens
//!
//! This module defines the token types produced by the lexer.
//!
//! ## Token Categories
//!
//! | Category    | Kinds                                                     |
//! |-------------|-----------------------------------------------------------|
//! | Keywords    | `if`, `then`, `else`, `when`, `and`, `or`, `using`,       |
//! |             | `with`, `to`, `in`, `from`                                |
//! | Verbs       | `send(s)`, `store(s)`, `validate(s)`, `process(es)`,      |
//! |             | `trigger(s)`, `call(s)`                                   |
//! | Names       | `Service` (capitalized word), `Identifier`                |
//! | Literals    | `StringLiteral`, `IntLiteral`, `FloatLiteral`             |
//! | Punctuation | `,` `.` `:` `;`                                           |
//!
//! Keywords and verbs are matched on whole words only, so `sender` is an
//! identifier and `Send` is a service name.

#ifndef TALKPP_LEXER_TOKEN_HPP
#define TALKPP_LEXER_TOKEN_HPP

#include "common.hpp"

#include <initializer_list>
#include <string>
#include <string_view>
#include <variant>

namespace talkpp::lexer {

/// The kind of a lexical token.
enum class TokenKind : uint8_t {
    // Keywords
    KwIf,
    KwThen,
    KwElse,
    KwWhen,
    KwAnd,
    KwOr,
    KwUsing,
    KwWith,
    KwTo,
    KwIn,
    KwFrom,

    // Action verbs (singular or plural surface form)
    VerbSend,
    VerbStore,
    VerbValidate,
    VerbProcess,
    VerbTrigger,
    VerbCall,

    // Names
    Service,    ///< `[A-Z][a-zA-Z0-9]*`
    Identifier, ///< `[a-z_][a-zA-Z0-9_]*`

    // Literals
    StringLiteral,
    IntLiteral,
    FloatLiteral,

    // Punctuation
    Comma,
    Dot,
    Colon,
    Semi,
};

/// A classified token with its source span and literal value.
struct Token {
    /// The kind of token.
    TokenKind kind;

    /// Byte range `[span.start.offset, span.end.offset)` plus line/column.
    SourceSpan span;

    /// Raw text from source, quotes included for strings.
    std::string lexeme;

    /// Literal value.
    ///
    /// - `std::monostate` for keywords, verbs and punctuation
    /// - `std::string` for `Identifier`, `Service` and `StringLiteral`
    ///   (string contents are unquoted and unescaped)
    /// - `int64_t` for `IntLiteral`
    /// - `double` for `FloatLiteral`
    std::variant<std::monostate, std::string, int64_t, double> value;

    [[nodiscard]] auto is(TokenKind k) const -> bool {
        return kind == k;
    }

    [[nodiscard]] auto is_one_of(std::initializer_list<TokenKind> kinds) const -> bool {
        for (auto k : kinds) {
            if (kind == k)
                return true;
        }
        return false;
    }

    /// Gets the text value of an `Identifier`, `Service` or `StringLiteral`.
    [[nodiscard]] auto string_value() const -> const std::string&;

    /// Gets the value of an `IntLiteral`.
    [[nodiscard]] auto int_value() const -> int64_t;

    /// Gets the value of a `FloatLiteral`.
    [[nodiscard]] auto float_value() const -> double;

    /// Returns the string value when present, otherwise the lexeme.
    [[nodiscard]] auto text() const -> std::string;
};

/// Returns a display name for a token kind (e.g. "'then'", "identifier").
[[nodiscard]] auto token_kind_to_string(TokenKind kind) -> std::string_view;

/// Checks if a token kind is a keyword.
[[nodiscard]] auto is_keyword(TokenKind kind) -> bool;

/// Checks if a token kind is an action verb.
[[nodiscard]] auto is_verb(TokenKind kind) -> bool;

/// Checks if a token kind is a literal.
[[nodiscard]] auto is_literal(TokenKind kind) -> bool;

} // namespace talkpp::lexer

#endif // TALKPP_LEXER_TOKEN_HPP
