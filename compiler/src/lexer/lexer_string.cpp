//! # Lexer - Strings
//!
//! This file implements string literal lexing for both quote forms.
//!
//! ## Forms
//!
//! - `"text"` double-quoted
//! - `` `text` `` backtick-quoted
//!
//! Both may span lines. The token value holds the contents without the
//! surrounding quotes, with escape sequences decoded.
//!
//! ## Escape Sequences
//!
//! | Escape | Character       |
//! |--------|-----------------|
//! | `\n`   | Newline         |
//! | `\t`   | Tab             |
//! | `\r`   | Carriage return |
//! | `\0`   | Null            |
//! | `\\`   | Backslash       |
//! | `\"`   | Double quote    |
//! | `\'`   | Single quote    |
//! | `` \` `` | Backtick      |
//!
//! Any other escape is kept verbatim, backslash included.

#include "lexer/lexer.hpp"

namespace talkpp::lexer {

auto Lexer::lex_string(char quote) -> Result<Token, LexicalError> {
    advance(); // opening quote

    std::string value;

    while (!is_at_end() && peek() != quote) {
        char c = advance();
        if (c != '\\') {
            value += c;
            continue;
        }

        if (is_at_end()) {
            break;
        }

        char escaped = advance();
        switch (escaped) {
        case 'n':
            value += '\n';
            break;
        case 't':
            value += '\t';
            break;
        case 'r':
            value += '\r';
            break;
        case '0':
            value += '\0';
            break;
        case '\\':
        case '"':
        case '\'':
        case '`':
            value += escaped;
            break;
        default:
            value += '\\';
            value += escaped;
            break;
        }
    }

    if (is_at_end()) {
        return make_error(token_start_, "Unterminated string literal");
    }

    advance(); // closing quote

    auto token = make_token(TokenKind::StringLiteral);
    token.value = std::move(value);
    return token;
}

} // namespace talkpp::lexer
