//! # Token Utilities
//!
//! Display names, category predicates and typed value accessors.

#include "lexer/token.hpp"

namespace talkpp::lexer {

auto token_kind_to_string(TokenKind kind) -> std::string_view {
    switch (kind) {
    // Keywords
    case TokenKind::KwIf:
        return "'if'";
    case TokenKind::KwThen:
        return "'then'";
    case TokenKind::KwElse:
        return "'else'";
    case TokenKind::KwWhen:
        return "'when'";
    case TokenKind::KwAnd:
        return "'and'";
    case TokenKind::KwOr:
        return "'or'";
    case TokenKind::KwUsing:
        return "'using'";
    case TokenKind::KwWith:
        return "'with'";
    case TokenKind::KwTo:
        return "'to'";
    case TokenKind::KwIn:
        return "'in'";
    case TokenKind::KwFrom:
        return "'from'";

    // Verbs
    case TokenKind::VerbSend:
        return "verb 'send'";
    case TokenKind::VerbStore:
        return "verb 'store'";
    case TokenKind::VerbValidate:
        return "verb 'validate'";
    case TokenKind::VerbProcess:
        return "verb 'process'";
    case TokenKind::VerbTrigger:
        return "verb 'trigger'";
    case TokenKind::VerbCall:
        return "verb 'call'";

    // Names and literals
    case TokenKind::Service:
        return "service name";
    case TokenKind::Identifier:
        return "identifier";
    case TokenKind::StringLiteral:
        return "string";
    case TokenKind::IntLiteral:
        return "integer";
    case TokenKind::FloatLiteral:
        return "float";

    // Punctuation
    case TokenKind::Comma:
        return "','";
    case TokenKind::Dot:
        return "'.'";
    case TokenKind::Colon:
        return "':'";
    case TokenKind::Semi:
        return "';'";
    }
    return "unknown";
}

auto is_keyword(TokenKind kind) -> bool {
    return kind >= TokenKind::KwIf && kind <= TokenKind::KwFrom;
}

auto is_verb(TokenKind kind) -> bool {
    return kind >= TokenKind::VerbSend && kind <= TokenKind::VerbCall;
}

auto is_literal(TokenKind kind) -> bool {
    return kind == TokenKind::StringLiteral || kind == TokenKind::IntLiteral ||
           kind == TokenKind::FloatLiteral;
}

auto Token::string_value() const -> const std::string& {
    return std::get<std::string>(value);
}

auto Token::int_value() const -> int64_t {
    return std::get<int64_t>(value);
}

auto Token::float_value() const -> double {
    return std::get<double>(value);
}

auto Token::text() const -> std::string {
    if (const auto* s = std::get_if<std::string>(&value)) {
        return *s;
    }
    return lexeme;
}

} // namespace talkpp::lexer
