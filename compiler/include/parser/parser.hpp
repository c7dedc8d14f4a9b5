//! # Talk++ Parser
//!
//! Recursive-descent parser turning a token sequence into a `Program`.
//!
//! ## Grammar
//!
//! ```text
//! program      := (statement | separator)*
//! statement    := conditional | action_stmt | assignment
//! conditional  := ('if'|'when') condition 'then' block ('else' block)?
//! block        := (action_stmt ','?)* ('.'|';')?
//! condition    := primary_cond (('and'|'or') primary_cond)*
//! primary_cond := identifier identifier+ (('in'|'from'|'to') (string|identifier))?
//! action_stmt  := verb target? (('using'|'with') Service)?
//! target       := string | identifier+
//! assignment   := identifier ':' expression
//! expression   := identifier | string | integer | float | Service
//! separator    := ',' | '.' | ';'
//! ```
//!
//! A statement starting with an identifier is an assignment when the next
//! token is `:`, otherwise an action with a custom verb.
//!
//! ## Error Handling
//!
//! Parsing stops at the first error. The reported line and column are those
//! of the current token, or the end of the last token when input ran out.

#ifndef TALKPP_PARSER_PARSER_HPP
#define TALKPP_PARSER_PARSER_HPP

#include "common.hpp"
#include "error.hpp"
#include "lexer/token.hpp"
#include "parser/ast.hpp"

#include <vector>

namespace talkpp::parser {

/// Parser for a Talk++ token sequence.
class Parser {
public:
    explicit Parser(std::vector<lexer::Token> tokens);

    /// Parses the whole token sequence.
    [[nodiscard]] auto parse_program() -> Result<Program, ParseError>;

private:
    std::vector<lexer::Token> tokens_;
    size_t pos_ = 0;

    // Token access
    [[nodiscard]] auto peek() const -> const lexer::Token&;
    [[nodiscard]] auto previous() const -> const lexer::Token&;
    auto advance() -> const lexer::Token&;
    [[nodiscard]] auto is_at_end() const -> bool;
    [[nodiscard]] auto check(lexer::TokenKind kind) const -> bool;
    [[nodiscard]] auto check_next(lexer::TokenKind kind) const -> bool;
    auto match(lexer::TokenKind kind) -> bool;

    // Error handling
    [[nodiscard]] auto error(const std::string& message) const -> ParseError;
    [[nodiscard]] auto span_from(const SourceSpan& start) const -> SourceSpan;

    // Statements
    auto parse_statement() -> Result<Stmt, ParseError>;
    auto parse_conditional() -> Result<ConditionalStatement, ParseError>;
    auto parse_action_block() -> Result<std::vector<ActionStatement>, ParseError>;
    auto parse_action() -> Result<ActionStatement, ParseError>;
    auto parse_target() -> std::optional<Expr>;
    auto parse_service() -> Result<std::optional<ServiceCall>, ParseError>;
    auto parse_assignment() -> Result<Stmt, ParseError>;
    [[nodiscard]] auto starts_action() const -> bool;

    // Conditions
    auto parse_condition() -> Result<Condition, ParseError>;
    auto parse_primary_condition() -> Result<Condition, ParseError>;

    // Expressions
    auto parse_expression() -> Result<Expr, ParseError>;
};

/// Returns true for `,`, `.` and `;`.
[[nodiscard]] auto is_separator(lexer::TokenKind kind) -> bool;

/// Parses a token sequence into a program.
[[nodiscard]] auto parse(std::vector<lexer::Token> tokens) -> Result<Program, CompilerError>;

} // namespace talkpp::parser

#endif // TALKPP_PARSER_PARSER_HPP
