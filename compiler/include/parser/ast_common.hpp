//! # AST Common Types
//!
//! This module contains forward declarations, pointer type aliases, and the
//! small enumerations shared by the syntax tree headers.
//!
//! ## Architecture
//!
//! - `ast_common.hpp` - Forward declarations, pointers, operators (this file)
//! - `ast_exprs.hpp` - Expressions (`Expr`, `IdentExpr`, `PropertyExpr`, etc.)
//! - `ast_conds.hpp` - Conditions (`Condition`, `EventCondition`, etc.)
//! - `ast_stmts.hpp` - Statements (`Stmt`, `ActionStatement`, etc.)
//! - `ast.hpp` - Program root, factory functions and printer
//!
//! ## Ownership Model
//!
//! Recursive children are owned via `Box<T>`. A `Program` owns its whole tree;
//! nothing is shared and the tree is never mutated after parsing.

#ifndef TALKPP_PARSER_AST_COMMON_HPP
#define TALKPP_PARSER_AST_COMMON_HPP

#include "common.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace talkpp::parser {

// ============================================================================
// Forward Declarations
// ============================================================================

struct Expr;
struct Condition;

// ============================================================================
// Pointer Type Aliases
// ============================================================================

using ExprPtr = Box<Expr>;
using CondPtr = Box<Condition>;

// ============================================================================
// Operators
// ============================================================================

/// Comparison operators in `Comparison` conditions.
enum class ComparisonOp {
    Equal,        ///< `==`
    NotEqual,     ///< `!=`
    GreaterThan,  ///< `>`
    LessThan,     ///< `<`
    GreaterEqual, ///< `>=`
    LessEqual,    ///< `<=`
};

/// Connectives joining conditions. Both bind equally tight.
enum class LogicalOp {
    And,
    Or,
};

/// Returns the conventional symbol for a comparison operator ("==").
[[nodiscard]] auto comparison_op_symbol(ComparisonOp op) -> std::string_view;

/// Returns the keyword for a logical operator ("and").
[[nodiscard]] auto logical_op_name(LogicalOp op) -> std::string_view;

} // namespace talkpp::parser

#endif // TALKPP_PARSER_AST_COMMON_HPP
