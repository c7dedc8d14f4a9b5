//! # Lexer Core
//!
//! This file implements core lexer functionality including:
//!
//! - **Word table**: Maps keyword and verb text to token kinds
//! - **Character access**: `peek()`, `advance()`, `is_at_end()`
//! - **Token creation**: `make_token()`, `make_error()`
//! - **Trivia**: Whitespace, line (`//`) and block (`/* */`) comments
//!
//! ## Word Categories
//!
//! | Category   | Words                                                    |
//! |------------|----------------------------------------------------------|
//! | Control    | `if`, `then`, `else`, `when`                             |
//! | Logical    | `and`, `or`                                              |
//! | Services   | `using`, `with`                                          |
//! | Context    | `to`, `in`, `from`                                       |
//! | Verbs      | `send`, `store`, `validate`, `process`, `trigger`, `call`|

#include "lexer/lexer.hpp"

#include <algorithm>
#include <unordered_map>

namespace talkpp::lexer {

namespace {

// Keyword and verb lookup table. Lowercase only.
const std::unordered_map<std::string_view, TokenKind> WORDS = {
    // Control
    {"if", TokenKind::KwIf},
    {"then", TokenKind::KwThen},
    {"else", TokenKind::KwElse},
    {"when", TokenKind::KwWhen},

    // Logical
    {"and", TokenKind::KwAnd},
    {"or", TokenKind::KwOr},

    // Services
    {"using", TokenKind::KwUsing},
    {"with", TokenKind::KwWith},

    // Context
    {"to", TokenKind::KwTo},
    {"in", TokenKind::KwIn},
    {"from", TokenKind::KwFrom},

    // Verbs
    {"send", TokenKind::VerbSend},
    {"sends", TokenKind::VerbSend},
    {"store", TokenKind::VerbStore},
    {"stores", TokenKind::VerbStore},
    {"validate", TokenKind::VerbValidate},
    {"validates", TokenKind::VerbValidate},
    {"process", TokenKind::VerbProcess},
    {"processes", TokenKind::VerbProcess},
    {"trigger", TokenKind::VerbTrigger},
    {"triggers", TokenKind::VerbTrigger},
    {"call", TokenKind::VerbCall},
    {"calls", TokenKind::VerbCall},
};

// Byte length of the UTF-8 sequence introduced by `lead`.
auto utf8_length(unsigned char lead) -> size_t {
    if (lead < 0x80)
        return 1;
    if ((lead & 0xE0) == 0xC0)
        return 2;
    if ((lead & 0xF0) == 0xE0)
        return 3;
    if ((lead & 0xF8) == 0xF0)
        return 4;
    return 1;
}

} // anonymous namespace

auto get_words() -> const std::unordered_map<std::string_view, TokenKind>& {
    return WORDS;
}

auto is_identifier_start(char c) -> bool {
    return (c >= 'a' && c <= 'z') || c == '_';
}

auto is_identifier_continue(char c) -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '_';
}

auto is_service_start(char c) -> bool {
    return c >= 'A' && c <= 'Z';
}

Lexer::Lexer(const Source& source) : source_(source) {}

auto Lexer::peek() const -> char {
    return source_.at(pos_);
}

auto Lexer::peek_next() const -> char {
    return source_.at(pos_ + 1);
}

auto Lexer::advance() -> char {
    char c = peek();
    ++pos_;
    return c;
}

auto Lexer::is_at_end() const -> bool {
    return pos_ >= source_.length();
}

auto Lexer::advance_cursor(size_t offset) -> SourceLocation {
    offset = std::min(offset, source_.length());
    for (size_t i = cursor_.offset; i < offset; ++i) {
        char c = source_.at(i);
        if (c == '\n') {
            ++cursor_.line;
            cursor_.column = 1;
        } else if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++cursor_.column;
        }
    }
    if (offset > cursor_.offset) {
        cursor_.offset = static_cast<uint32_t>(offset);
    }
    return cursor_;
}

auto Lexer::make_token(TokenKind kind) -> Token {
    auto start_loc = advance_cursor(token_start_);
    auto end_loc = advance_cursor(pos_);
    start_loc.length = static_cast<uint32_t>(pos_ - token_start_);

    return Token{.kind = kind,
                 .span = {start_loc, end_loc},
                 .lexeme = std::string(source_.slice(token_start_, pos_)),
                 .value = std::monostate{}};
}

auto Lexer::make_error(size_t position, std::string message) const -> LexicalError {
    return LexicalError{.position = position, .message = std::move(message)};
}

auto Lexer::invalid_token_error() const -> LexicalError {
    auto len = utf8_length(static_cast<unsigned char>(source_.at(token_start_)));
    auto text = source_.slice(token_start_, token_start_ + len);
    return make_error(token_start_, "Invalid token: '" + std::string(text) + "'");
}

auto Lexer::skip_trivia() -> std::optional<LexicalError> {
    while (!is_at_end()) {
        char c = peek();
        switch (c) {
        case ' ':
        case '\t':
        case '\n':
        case '\r':
        case '\f':
        case '\v':
            advance();
            break;
        case '/':
            if (peek_next() == '/') {
                skip_line_comment();
            } else if (peek_next() == '*') {
                size_t comment_start = pos_;
                if (!skip_block_comment()) {
                    return make_error(comment_start, "Unterminated block comment");
                }
            } else {
                return std::nullopt;
            }
            break;
        default:
            return std::nullopt;
        }
    }
    return std::nullopt;
}

void Lexer::skip_line_comment() {
    while (!is_at_end() && peek() != '\n') {
        advance();
    }
}

auto Lexer::skip_block_comment() -> bool {
    advance(); // '/'
    advance(); // '*'

    // Block comments do not nest.
    while (!is_at_end()) {
        if (peek() == '*' && peek_next() == '/') {
            advance();
            advance();
            return true;
        }
        advance();
    }
    return false;
}

} // namespace talkpp::lexer
