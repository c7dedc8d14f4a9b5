//! # Lexer - Words
//!
//! This file implements identifier, keyword, verb and service name lexing.
//!
//! ## Word Rules
//!
//! - Lowercase words `[a-z_][a-zA-Z0-9_]*` are scanned whole, then looked up
//!   in the word table. A hit yields the keyword or verb kind, a miss yields
//!   an `Identifier`.
//! - Capitalized words `[A-Z][a-zA-Z0-9]*` are `Service` names. They stop at
//!   the first underscore.

#include "lexer/lexer.hpp"

#include <unordered_map>

namespace talkpp::lexer {

extern auto get_words() -> const std::unordered_map<std::string_view, TokenKind>&;

auto Lexer::lex_word() -> Token {
    while (!is_at_end() && is_identifier_continue(peek())) {
        advance();
    }

    auto lexeme = source_.slice(token_start_, pos_);

    const auto& words = get_words();
    auto it = words.find(lexeme);
    if (it != words.end()) {
        return make_token(it->second);
    }

    auto token = make_token(TokenKind::Identifier);
    token.value = std::string(lexeme);
    return token;
}

auto Lexer::lex_service() -> Token {
    while (!is_at_end()) {
        char c = peek();
        if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')) {
            advance();
        } else {
            break;
        }
    }

    auto token = make_token(TokenKind::Service);
    token.value = token.lexeme;
    return token;
}

} // namespace talkpp::lexer
