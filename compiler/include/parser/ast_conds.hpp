//! # AST Conditions
//!
//! The guard of a conditional statement.
//!
//! ## Condition Kinds
//!
//! - `EventCondition`: `new user registers in "checkout"`. The last word is
//!   the action, the preceding words form the subject.
//! - `ComparisonCondition`: `left <op> right`.
//! - `LogicalCondition`: two conditions joined by `and`/`or`. Chains fold
//!   left, so `a and b or c` is `(a and b) or c`.

#ifndef TALKPP_PARSER_AST_CONDS_HPP
#define TALKPP_PARSER_AST_CONDS_HPP

#include "parser/ast_exprs.hpp"

namespace talkpp::parser {

/// Something happened: subject words followed by an action word.
struct EventCondition {
    std::string subject;                ///< Space-joined subject words.
    std::string action;                 ///< Final word.
    std::optional<std::string> context; ///< Word or string after in/from/to.
    SourceSpan span;
};

/// Binary comparison between two expressions.
struct ComparisonCondition {
    ExprPtr left;
    ComparisonOp op;
    ExprPtr right;
    SourceSpan span;
};

/// Two conditions joined by `and` or `or`.
struct LogicalCondition {
    CondPtr left;
    LogicalOp op;
    CondPtr right;
    SourceSpan span;
};

/// A condition node.
struct Condition {
    std::variant<EventCondition, ComparisonCondition, LogicalCondition> kind;
    SourceSpan span;

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    /// Throws `std::bad_variant_access` if wrong kind.
    template <typename T> [[nodiscard]] auto as() const -> const T& {
        return std::get<T>(kind);
    }
};

} // namespace talkpp::parser

#endif // TALKPP_PARSER_AST_CONDS_HPP
