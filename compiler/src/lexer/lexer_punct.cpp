//! # Lexer - Punctuation
//!
//! Talk++ has four punctuation tokens: `,` `.` `:` `;`. Any other character
//! that reaches this point is an invalid token.

#include "lexer/lexer.hpp"

namespace talkpp::lexer {

auto Lexer::lex_punctuation() -> Result<Token, LexicalError> {
    switch (peek()) {
    case ',':
        advance();
        return make_token(TokenKind::Comma);
    case '.':
        advance();
        return make_token(TokenKind::Dot);
    case ':':
        advance();
        return make_token(TokenKind::Colon);
    case ';':
        advance();
        return make_token(TokenKind::Semi);
    default:
        return invalid_token_error();
    }
}

} // namespace talkpp::lexer
