//! # Parser Core
//!
//! This file implements the parser infrastructure and the program loop.
//!
//! ## Token Navigation
//!
//! | Method         | Description                            |
//! |----------------|----------------------------------------|
//! | `peek()`       | Look at current token                  |
//! | `check_next()` | Check the token after the current one  |
//! | `advance()`    | Consume and return current token       |
//! | `previous()`   | Get last consumed token                |
//! | `match()`      | Consume token if it matches            |
//! | `check()`      | Check current token without consuming  |
//!
//! The token sequence has no end marker. `check()` and `check_next()` return
//! false past the end; `peek()` must only be called when not at end.

#include "log/log.hpp"
#include "parser/parser.hpp"

namespace talkpp::parser {

Parser::Parser(std::vector<lexer::Token> tokens) : tokens_(std::move(tokens)) {}

auto Parser::peek() const -> const lexer::Token& {
    return tokens_[pos_];
}

auto Parser::previous() const -> const lexer::Token& {
    return tokens_[pos_ == 0 ? 0 : pos_ - 1];
}

auto Parser::advance() -> const lexer::Token& {
    if (!is_at_end()) {
        ++pos_;
    }
    return previous();
}

auto Parser::is_at_end() const -> bool {
    return pos_ >= tokens_.size();
}

auto Parser::check(lexer::TokenKind kind) const -> bool {
    return !is_at_end() && tokens_[pos_].kind == kind;
}

auto Parser::check_next(lexer::TokenKind kind) const -> bool {
    return pos_ + 1 < tokens_.size() && tokens_[pos_ + 1].kind == kind;
}

auto Parser::match(lexer::TokenKind kind) -> bool {
    if (check(kind)) {
        advance();
        return true;
    }
    return false;
}

auto Parser::error(const std::string& message) const -> ParseError {
    if (!is_at_end()) {
        const auto& loc = peek().span.start;
        return ParseError{.line = loc.line, .column = loc.column, .message = message};
    }
    if (!tokens_.empty()) {
        const auto& loc = tokens_.back().span.end;
        return ParseError{.line = loc.line, .column = loc.column, .message = message};
    }
    return ParseError{.line = 1, .column = 1, .message = message};
}

auto Parser::span_from(const SourceSpan& start) const -> SourceSpan {
    return SourceSpan::merge(start, previous().span);
}

auto Parser::parse_program() -> Result<Program, ParseError> {
    Program program;

    while (!is_at_end()) {
        if (is_separator(peek().kind)) {
            advance();
            continue;
        }

        auto stmt = parse_statement();
        if (is_err(stmt)) {
            return unwrap_err(stmt);
        }
        program.statements.push_back(std::move(unwrap(stmt)));
    }

    TALKPP_LOG_DEBUG("parser", "Parsed " << program.statements.size() << " statements from "
                                         << tokens_.size() << " tokens");
    return program;
}

auto is_separator(lexer::TokenKind kind) -> bool {
    return kind == lexer::TokenKind::Comma || kind == lexer::TokenKind::Dot ||
           kind == lexer::TokenKind::Semi;
}

auto parse(std::vector<lexer::Token> tokens) -> Result<Program, CompilerError> {
    Parser parser(std::move(tokens));
    auto result = parser.parse_program();
    if (is_err(result)) {
        const auto& err = unwrap_err(result);
        TALKPP_LOG_DEBUG("parser", "Failed at " << err.line << ":" << err.column << ": "
                                                << err.message);
        return CompilerError(std::move(unwrap_err(result)));
    }
    return std::move(unwrap(result));
}

} // namespace talkpp::parser
