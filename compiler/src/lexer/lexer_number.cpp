//! # Lexer - Numbers
//!
//! This file implements numeric literal lexing.
//!
//! ## Formats
//!
//! | Form        | Example | Token          |
//! |-------------|---------|----------------|
//! | `\d+`       | `42`    | `IntLiteral`   |
//! | `\d+\.\d+`  | `3.14`  | `FloatLiteral` |
//!
//! A dot not followed by a digit is left for the punctuation lexer, so `3.`
//! is the integer `3` followed by `.`. Integers must fit a signed 64-bit value.

#include "lexer/lexer.hpp"

#include <charconv>
#include <cstdlib>

namespace talkpp::lexer {

namespace {

auto is_digit(char c) -> bool {
    return c >= '0' && c <= '9';
}

} // anonymous namespace

auto Lexer::lex_number() -> Result<Token, LexicalError> {
    while (!is_at_end() && is_digit(peek())) {
        advance();
    }

    bool is_float = false;
    if (peek() == '.' && is_digit(peek_next())) {
        is_float = true;
        advance(); // consume '.'
        while (!is_at_end() && is_digit(peek())) {
            advance();
        }
    }

    auto digits = source_.slice(token_start_, pos_);

    if (is_float) {
        std::string text(digits);
        double value = std::strtod(text.c_str(), nullptr);
        auto token = make_token(TokenKind::FloatLiteral);
        token.value = value;
        return token;
    }

    int64_t value = 0;
    auto result = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (result.ec != std::errc{}) {
        return make_error(token_start_, "Integer literal out of range: " + std::string(digits));
    }

    auto token = make_token(TokenKind::IntLiteral);
    token.value = value;
    return token;
}

} // namespace talkpp::lexer
