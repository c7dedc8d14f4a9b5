//! # AST Factory Functions
//!
//! This file provides factory functions for creating AST nodes, and the
//! action and operator helpers.
//!
//! ## Factory Functions
//!
//! | Function                    | Creates                      |
//! |-----------------------------|------------------------------|
//! | `make_ident_expr`           | Identifier expression        |
//! | `make_string_expr`          | String literal               |
//! | `make_int_expr`             | Integer literal              |
//! | `make_float_expr`           | Float literal                |
//! | `make_event_condition`      | Event condition              |
//! | `make_logical_condition`    | `and`/`or` of two conditions |
//! | `make_action_stmt`          | Action statement             |
//! | `make_conditional_stmt`     | Conditional statement        |
//! | `make_assignment_stmt`      | Assignment statement         |

#include "parser/ast.hpp"

#include <algorithm>
#include <cctype>

namespace talkpp::parser {

// ============================================================================
// Operators
// ============================================================================

auto comparison_op_symbol(ComparisonOp op) -> std::string_view {
    switch (op) {
    case ComparisonOp::Equal:
        return "==";
    case ComparisonOp::NotEqual:
        return "!=";
    case ComparisonOp::GreaterThan:
        return ">";
    case ComparisonOp::LessThan:
        return "<";
    case ComparisonOp::GreaterEqual:
        return ">=";
    case ComparisonOp::LessEqual:
        return "<=";
    }
    return "==";
}

auto logical_op_name(LogicalOp op) -> std::string_view {
    return op == LogicalOp::And ? "and" : "or";
}

// ============================================================================
// Actions
// ============================================================================

auto Action::from_verb(std::string_view word) -> Action {
    std::string lower(word);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "send" || lower == "sends")
        return Action{.kind = ActionKind::Send};
    if (lower == "store" || lower == "stores")
        return Action{.kind = ActionKind::Store};
    if (lower == "validate" || lower == "validates")
        return Action{.kind = ActionKind::Validate};
    if (lower == "process" || lower == "processes")
        return Action{.kind = ActionKind::Process};
    if (lower == "trigger" || lower == "triggers")
        return Action{.kind = ActionKind::Trigger};
    if (lower == "call" || lower == "calls")
        return Action{.kind = ActionKind::Call};

    return Action{.kind = ActionKind::Custom, .custom_name = std::string(word)};
}

auto Action::name() const -> std::string {
    switch (kind) {
    case ActionKind::Send:
        return "send";
    case ActionKind::Store:
        return "store";
    case ActionKind::Validate:
        return "validate";
    case ActionKind::Process:
        return "process";
    case ActionKind::Trigger:
        return "trigger";
    case ActionKind::Call:
        return "call";
    case ActionKind::Custom:
        return custom_name;
    }
    return custom_name;
}

// ============================================================================
// Expressions
// ============================================================================

auto make_ident_expr(std::string name, SourceSpan span) -> Expr {
    return Expr{.kind = IdentExpr{.name = std::move(name), .span = span}, .span = span};
}

auto make_string_expr(std::string value, SourceSpan span) -> Expr {
    return Expr{.kind = StringExpr{.value = std::move(value), .span = span}, .span = span};
}

auto make_int_expr(int64_t value, SourceSpan span) -> Expr {
    return Expr{.kind = IntExpr{.value = value, .span = span}, .span = span};
}

auto make_float_expr(double value, SourceSpan span) -> Expr {
    return Expr{.kind = FloatExpr{.value = value, .span = span}, .span = span};
}

auto make_bool_expr(bool value, SourceSpan span) -> Expr {
    return Expr{.kind = BoolExpr{.value = value, .span = span}, .span = span};
}

auto make_property_expr(Expr object, std::string property, SourceSpan span) -> Expr {
    return Expr{.kind = PropertyExpr{.object = make_box<Expr>(std::move(object)),
                                     .property = std::move(property),
                                     .span = span},
                .span = span};
}

auto make_function_call_expr(std::string name, std::vector<Expr> args, SourceSpan span) -> Expr {
    std::vector<ExprPtr> boxed;
    boxed.reserve(args.size());
    for (auto& arg : args) {
        boxed.push_back(make_box<Expr>(std::move(arg)));
    }
    return Expr{
        .kind = FunctionCallExpr{.name = std::move(name), .args = std::move(boxed), .span = span},
        .span = span};
}

// ============================================================================
// Conditions
// ============================================================================

auto make_event_condition(std::string subject, std::string action,
                          std::optional<std::string> context, SourceSpan span) -> Condition {
    return Condition{.kind = EventCondition{.subject = std::move(subject),
                                            .action = std::move(action),
                                            .context = std::move(context),
                                            .span = span},
                     .span = span};
}

auto make_comparison_condition(Expr left, ComparisonOp op, Expr right, SourceSpan span)
    -> Condition {
    return Condition{.kind = ComparisonCondition{.left = make_box<Expr>(std::move(left)),
                                                 .op = op,
                                                 .right = make_box<Expr>(std::move(right)),
                                                 .span = span},
                     .span = span};
}

auto make_logical_condition(Condition left, LogicalOp op, Condition right) -> Condition {
    auto span = SourceSpan::merge(left.span, right.span);
    return Condition{.kind = LogicalCondition{.left = make_box<Condition>(std::move(left)),
                                              .op = op,
                                              .right = make_box<Condition>(std::move(right)),
                                              .span = span},
                     .span = span};
}

// ============================================================================
// Statements
// ============================================================================

auto make_action_stmt(ActionStatement action) -> Stmt {
    auto span = action.span;
    return Stmt{.kind = std::move(action), .span = span};
}

auto make_conditional_stmt(ConditionalStatement conditional) -> Stmt {
    auto span = conditional.span;
    return Stmt{.kind = std::move(conditional), .span = span};
}

auto make_assignment_stmt(std::string variable, Expr value, SourceSpan span) -> Stmt {
    return Stmt{.kind = AssignmentStatement{.variable = std::move(variable),
                                            .value = std::move(value),
                                            .span = span},
                .span = span};
}

auto make_comment_stmt(std::string text, SourceSpan span) -> Stmt {
    return Stmt{.kind = CommentStatement{.text = std::move(text), .span = span}, .span = span};
}

} // namespace talkpp::parser
