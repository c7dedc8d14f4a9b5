//! # Parser - Conditions
//!
//! This file implements condition parsing.
//!
//! ## Event Conditions
//!
//! A run of at least two identifiers. The last word is the action, the
//! others (space-joined) are the subject:
//!
//! | Input                        | Subject    | Action      | Context    |
//! |------------------------------|------------|-------------|------------|
//! | `user registers`             | `user`     | `registers` |            |
//! | `new user registers`         | `new user` | `registers` |            |
//! | `order ships to "warehouse"` | `order`    | `ships`     | `warehouse`|
//!
//! ## Chaining
//!
//! `and` and `or` have equal precedence and fold left:
//! `a b and c d or e f` is `((a b and c d) or e f)`.

#include "parser/parser.hpp"

namespace talkpp::parser {

using lexer::TokenKind;

auto Parser::parse_condition() -> Result<Condition, ParseError> {
    auto first = parse_primary_condition();
    if (is_err(first)) {
        return unwrap_err(first);
    }
    Condition condition = std::move(unwrap(first));

    while (check(TokenKind::KwAnd) || check(TokenKind::KwOr)) {
        auto op = advance().is(TokenKind::KwAnd) ? LogicalOp::And : LogicalOp::Or;

        auto right = parse_primary_condition();
        if (is_err(right)) {
            return unwrap_err(right);
        }
        condition = make_logical_condition(std::move(condition), op, std::move(unwrap(right)));
    }

    return condition;
}

auto Parser::parse_primary_condition() -> Result<Condition, ParseError> {
    std::vector<std::string> words;
    SourceSpan start{};
    if (check(TokenKind::Identifier)) {
        start = peek().span;
    }
    while (check(TokenKind::Identifier)) {
        words.push_back(advance().string_value());
    }

    if (words.size() < 2) {
        return error("Expected condition");
    }

    std::string action = std::move(words.back());
    words.pop_back();

    std::string subject;
    for (const auto& word : words) {
        if (!subject.empty()) {
            subject += ' ';
        }
        subject += word;
    }

    std::optional<std::string> context;
    if (check(TokenKind::KwIn) || check(TokenKind::KwFrom) || check(TokenKind::KwTo)) {
        const auto& preposition = advance();
        if (!check(TokenKind::StringLiteral) && !check(TokenKind::Identifier)) {
            return error("Expected context after '" + preposition.lexeme + "'");
        }
        context = advance().string_value();
    }

    return make_event_condition(std::move(subject), std::move(action), std::move(context),
                                span_from(start));
}

} // namespace talkpp::parser
