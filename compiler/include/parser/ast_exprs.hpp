//! # AST Expressions
//!
//! Values that appear as action targets, assignment values, comparison
//! operands and service configuration entries.
//!
//! ## Expression Kinds
//!
//! | Kind               | Example          | Produced by parser |
//! |--------------------|------------------|--------------------|
//! | `IdentExpr`        | `email`          | yes                |
//! | `StringExpr`       | `"hello"`        | yes                |
//! | `IntExpr`          | `42`             | yes                |
//! | `FloatExpr`        | `3.14`           | yes                |
//! | `BoolExpr`         | `true`           | no                 |
//! | `PropertyExpr`     | `user.email`     | no                 |
//! | `FunctionCallExpr` | `now()`          | no                 |
//!
//! The last three kinds have no surface syntax yet. The code generator rejects
//! `PropertyExpr` and `FunctionCallExpr` as unsupported.

#ifndef TALKPP_PARSER_AST_EXPRS_HPP
#define TALKPP_PARSER_AST_EXPRS_HPP

#include "parser/ast_common.hpp"

namespace talkpp::parser {

/// A name reference. Multi-word targets keep their words space-separated.
struct IdentExpr {
    std::string name;
    SourceSpan span;
};

/// A string literal, already unescaped.
struct StringExpr {
    std::string value;
    SourceSpan span;
};

/// A signed 64-bit integer literal.
struct IntExpr {
    int64_t value;
    SourceSpan span;
};

/// A double-precision float literal.
struct FloatExpr {
    double value;
    SourceSpan span;
};

/// A boolean literal.
struct BoolExpr {
    bool value;
    SourceSpan span;
};

/// Field access: `object.property`.
struct PropertyExpr {
    ExprPtr object;
    std::string property;
    SourceSpan span;
};

/// Named call: `name(args...)`.
struct FunctionCallExpr {
    std::string name;
    std::vector<ExprPtr> args;
    SourceSpan span;
};

/// An expression node.
struct Expr {
    std::variant<IdentExpr, StringExpr, IntExpr, FloatExpr, BoolExpr, PropertyExpr,
                 FunctionCallExpr>
        kind;
    SourceSpan span;

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    /// Throws `std::bad_variant_access` if wrong kind.
    template <typename T> [[nodiscard]] auto as() const -> const T& {
        return std::get<T>(kind);
    }

    /// True for string, integer, float and boolean literals.
    [[nodiscard]] auto is_literal() const -> bool {
        return is<StringExpr>() || is<IntExpr>() || is<FloatExpr>() || is<BoolExpr>();
    }
};

} // namespace talkpp::parser

#endif // TALKPP_PARSER_AST_EXPRS_HPP
