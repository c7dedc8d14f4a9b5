//! # Parser - Statements
//!
//! This file implements statement parsing.
//!
//! ## Statement Dispatch
//!
//! | Leading token        | Production                               |
//! |----------------------|------------------------------------------|
//! | `if`, `when`         | `parse_conditional()`                    |
//! | verb                 | `parse_action()`                         |
//! | identifier, then `:` | `parse_assignment()`                     |
//! | identifier           | `parse_action()` with a custom verb      |
//!
//! Any other leading token is an error.
//!
//! ## Blocks
//!
//! `then` and `else` blocks hold action statements only. A block ends at the
//! first token that cannot start an action; `.` or `;` also ends it and is
//! consumed, `,` separates actions inside it.

#include "parser/parser.hpp"

namespace talkpp::parser {

using lexer::TokenKind;

auto Parser::parse_statement() -> Result<Stmt, ParseError> {
    const auto& token = peek();

    if (token.is_one_of({TokenKind::KwIf, TokenKind::KwWhen})) {
        auto conditional = parse_conditional();
        if (is_err(conditional)) {
            return unwrap_err(conditional);
        }
        return make_conditional_stmt(std::move(unwrap(conditional)));
    }

    if (token.is(TokenKind::Identifier) && check_next(TokenKind::Colon)) {
        return parse_assignment();
    }

    if (starts_action()) {
        auto action = parse_action();
        if (is_err(action)) {
            return unwrap_err(action);
        }
        return make_action_stmt(std::move(unwrap(action)));
    }

    return error("Expected statement, found " +
                 std::string(lexer::token_kind_to_string(token.kind)));
}

auto Parser::starts_action() const -> bool {
    if (is_at_end()) {
        return false;
    }
    const auto& token = peek();
    if (lexer::is_verb(token.kind)) {
        return true;
    }
    return token.is(TokenKind::Identifier) && !check_next(TokenKind::Colon);
}

auto Parser::parse_conditional() -> Result<ConditionalStatement, ParseError> {
    auto start = advance().span; // 'if' or 'when'

    auto condition = parse_condition();
    if (is_err(condition)) {
        return unwrap_err(condition);
    }

    if (!match(TokenKind::KwThen)) {
        return error("Expected 'then' after condition");
    }

    auto then_actions = parse_action_block();
    if (is_err(then_actions)) {
        return unwrap_err(then_actions);
    }

    std::optional<std::vector<ActionStatement>> else_actions;
    if (match(TokenKind::KwElse)) {
        auto actions = parse_action_block();
        if (is_err(actions)) {
            return unwrap_err(actions);
        }
        else_actions = std::move(unwrap(actions));
    }

    return ConditionalStatement{.condition = std::move(unwrap(condition)),
                                .then_actions = std::move(unwrap(then_actions)),
                                .else_actions = std::move(else_actions),
                                .span = span_from(start)};
}

auto Parser::parse_action_block() -> Result<std::vector<ActionStatement>, ParseError> {
    std::vector<ActionStatement> actions;

    while (!is_at_end()) {
        if (match(TokenKind::Dot) || match(TokenKind::Semi)) {
            break;
        }
        if (match(TokenKind::Comma)) {
            continue;
        }
        if (!starts_action()) {
            break;
        }

        auto action = parse_action();
        if (is_err(action)) {
            return unwrap_err(action);
        }
        actions.push_back(std::move(unwrap(action)));
    }

    return actions;
}

auto Parser::parse_action() -> Result<ActionStatement, ParseError> {
    if (!starts_action()) {
        return error("Expected action verb");
    }

    const auto& verb = advance();
    auto start = verb.span;
    auto action = Action::from_verb(verb.text());

    auto target = parse_target();

    auto service = parse_service();
    if (is_err(service)) {
        return unwrap_err(service);
    }

    return ActionStatement{.action = std::move(action),
                           .target = std::move(target),
                           .service = std::move(unwrap(service)),
                           .parameters = {},
                           .span = span_from(start)};
}

auto Parser::parse_target() -> std::optional<Expr> {
    if (check(TokenKind::StringLiteral)) {
        const auto& token = advance();
        return make_string_expr(token.string_value(), token.span);
    }

    if (!check(TokenKind::Identifier) || check_next(TokenKind::Colon)) {
        return std::nullopt;
    }

    // A run of words is one target: "welcome message".
    auto start = peek().span;
    std::string name = advance().string_value();
    while (check(TokenKind::Identifier) && !check_next(TokenKind::Colon)) {
        name += ' ';
        name += advance().string_value();
    }
    return make_ident_expr(std::move(name), span_from(start));
}

auto Parser::parse_service() -> Result<std::optional<ServiceCall>, ParseError> {
    if (!check(TokenKind::KwUsing) && !check(TokenKind::KwWith)) {
        return std::optional<ServiceCall>{};
    }

    const auto& keyword = advance();
    if (!check(TokenKind::Service)) {
        return error("Expected service name after '" + keyword.lexeme + "'");
    }

    const auto& name = advance();
    return std::optional<ServiceCall>{ServiceCall{.name = name.string_value(),
                                                  .method = std::nullopt,
                                                  .config = {},
                                                  .span = span_from(keyword.span)}};
}

auto Parser::parse_assignment() -> Result<Stmt, ParseError> {
    const auto& name = advance();
    auto start = name.span;
    std::string variable = name.string_value();

    if (!match(TokenKind::Colon)) {
        return error("Expected ':' after variable name");
    }

    auto value = parse_expression();
    if (is_err(value)) {
        return unwrap_err(value);
    }

    return make_assignment_stmt(std::move(variable), std::move(unwrap(value)), span_from(start));
}

} // namespace talkpp::parser
