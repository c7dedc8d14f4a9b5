//! # Abstract Syntax Tree (AST)
//!
//! This module defines the program root and the helpers that build and print
//! syntax trees. The parser produces a `Program`; the code generator reads it
//! without modification.
//!
//! ## Architecture
//!
//! The tree uses a variant-based design with three node categories, each
//! exposing `is<T>()` and `as<T>()`:
//!
//! - **Expressions**: Values (`Expr`)
//! - **Conditions**: Guards of conditionals (`Condition`)
//! - **Statements**: Top-level program items (`Stmt`)
//!
//! ## Source Spans
//!
//! Every node includes a `SourceSpan` covering the tokens it was built from.

#ifndef TALKPP_PARSER_AST_HPP
#define TALKPP_PARSER_AST_HPP

#include "parser/ast_common.hpp"
#include "parser/ast_conds.hpp"
#include "parser/ast_exprs.hpp"
#include "parser/ast_stmts.hpp"

#include <ostream>

namespace talkpp::parser {

/// The root of a parsed program: statements in source order.
struct Program {
    std::vector<Stmt> statements;
};

// ============================================================================
// Factory Functions
// ============================================================================

[[nodiscard]] auto make_ident_expr(std::string name, SourceSpan span) -> Expr;

[[nodiscard]] auto make_string_expr(std::string value, SourceSpan span) -> Expr;

[[nodiscard]] auto make_int_expr(int64_t value, SourceSpan span) -> Expr;

[[nodiscard]] auto make_float_expr(double value, SourceSpan span) -> Expr;

[[nodiscard]] auto make_bool_expr(bool value, SourceSpan span) -> Expr;

[[nodiscard]] auto make_property_expr(Expr object, std::string property, SourceSpan span) -> Expr;

[[nodiscard]] auto make_function_call_expr(std::string name, std::vector<Expr> args,
                                           SourceSpan span) -> Expr;

[[nodiscard]] auto make_event_condition(std::string subject, std::string action,
                                        std::optional<std::string> context, SourceSpan span)
    -> Condition;

[[nodiscard]] auto make_comparison_condition(Expr left, ComparisonOp op, Expr right,
                                             SourceSpan span) -> Condition;

/// Joins two conditions. The span covers both operands.
[[nodiscard]] auto make_logical_condition(Condition left, LogicalOp op, Condition right)
    -> Condition;

[[nodiscard]] auto make_action_stmt(ActionStatement action) -> Stmt;

[[nodiscard]] auto make_conditional_stmt(ConditionalStatement conditional) -> Stmt;

[[nodiscard]] auto make_assignment_stmt(std::string variable, Expr value, SourceSpan span)
    -> Stmt;

[[nodiscard]] auto make_comment_stmt(std::string text, SourceSpan span) -> Stmt;

// ============================================================================
// Printing
// ============================================================================

/// Writes an indented outline of the program, one node per line.
///
/// ```text
/// Program (1 statement)
///   Conditional
///     Event subject="new user" action="registers"
///     Then
///       Action validate
///         Target Ident "email"
///         Service SendGrid
/// ```
void print_program(std::ostream& out, const Program& program);

/// Returns the outline produced by `print_program()`.
[[nodiscard]] auto program_to_string(const Program& program) -> std::string;

} // namespace talkpp::parser

#endif // TALKPP_PARSER_AST_HPP
