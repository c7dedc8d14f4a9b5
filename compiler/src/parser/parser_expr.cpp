//! # Parser - Expressions
//!
//! Expressions are single tokens: identifiers, service names, strings,
//! integers and floats. Service names become identifier expressions.

#include "parser/parser.hpp"

namespace talkpp::parser {

using lexer::TokenKind;

auto Parser::parse_expression() -> Result<Expr, ParseError> {
    if (is_at_end()) {
        return error("Expected expression");
    }

    const auto& token = peek();
    switch (token.kind) {
    case TokenKind::Identifier:
    case TokenKind::Service:
        advance();
        return make_ident_expr(token.string_value(), token.span);
    case TokenKind::StringLiteral:
        advance();
        return make_string_expr(token.string_value(), token.span);
    case TokenKind::IntLiteral:
        advance();
        return make_int_expr(token.int_value(), token.span);
    case TokenKind::FloatLiteral:
        advance();
        return make_float_expr(token.float_value(), token.span);
    default:
        return error("Expected expression");
    }
}

} // namespace talkpp::parser
