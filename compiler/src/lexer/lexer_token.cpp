//! # Lexer - Token Dispatch
//!
//! This file implements the `next_token()` and `tokenize()` entry points.
//!
//! ## Token Dispatch Order
//!
//! 1. Skip whitespace and comments
//! 2. Return nothing at end of input
//! 3. Lowercase words: keywords, verbs, identifiers
//! 4. Capitalized words: service names
//! 5. Numbers
//! 6. Strings (`"` and `` ` ``)
//! 7. Punctuation
//!
//! Anything else is an invalid token.

#include "lexer/lexer.hpp"
#include "log/log.hpp"

namespace talkpp::lexer {

auto Lexer::next_token() -> Result<std::optional<Token>, LexicalError> {
    if (auto error = skip_trivia()) {
        return *error;
    }
    token_start_ = pos_;

    if (is_at_end()) {
        return std::optional<Token>{};
    }

    char c = peek();

    if (is_identifier_start(c)) {
        return std::optional<Token>{lex_word()};
    }

    if (is_service_start(c)) {
        return std::optional<Token>{lex_service()};
    }

    Result<Token, LexicalError> token = [&]() -> Result<Token, LexicalError> {
        if (c >= '0' && c <= '9') {
            return lex_number();
        }
        if (c == '"' || c == '`') {
            return lex_string(c);
        }
        return lex_punctuation();
    }();

    if (is_err(token)) {
        return unwrap_err(token);
    }
    return std::optional<Token>{std::move(unwrap(token))};
}

auto Lexer::tokenize() -> Result<std::vector<Token>, LexicalError> {
    std::vector<Token> tokens;

    while (true) {
        auto next = next_token();
        if (is_err(next)) {
            auto& error = unwrap_err(next);
            TALKPP_LOG_DEBUG("lexer", "Stopped at byte " << error.position << ": "
                                                         << error.message);
            return error;
        }
        auto& token = unwrap(next);
        if (!token) {
            break;
        }
        tokens.push_back(std::move(*token));
    }

    TALKPP_LOG_DEBUG("lexer", "Produced " << tokens.size() << " tokens from "
                                          << source_.length() << " bytes");
    return tokens;
}

auto tokenize(std::string_view text) -> Result<std::vector<Token>, CompilerError> {
    auto source = Source::from_string(std::string(text));
    Lexer lexer(source);
    auto result = lexer.tokenize();
    if (is_err(result)) {
        return CompilerError(std::move(unwrap_err(result)));
    }
    return std::move(unwrap(result));
}

} // namespace talkpp::lexer
