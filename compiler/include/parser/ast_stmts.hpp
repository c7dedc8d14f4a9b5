//! # AST Statements
//!
//! Statement nodes of a Talk++ program.
//!
//! ## Statement Kinds
//!
//! | Kind                   | Example                                      |
//! |------------------------|----------------------------------------------|
//! | `ActionStatement`      | `send welcome message using Twilio`          |
//! | `ConditionalStatement` | `if user registers then validate email`      |
//! | `AssignmentStatement`  | `retries: 3`                                 |
//! | `CommentStatement`     | reserved; the grammar has no comment syntax  |

#ifndef TALKPP_PARSER_AST_STMTS_HPP
#define TALKPP_PARSER_AST_STMTS_HPP

#include "parser/ast_conds.hpp"

#include <map>

namespace talkpp::parser {

// ============================================================================
// Actions
// ============================================================================

/// The canonical verbs, plus `Custom` for any other verb-like word.
enum class ActionKind {
    Send,
    Store,
    Validate,
    Process,
    Trigger,
    Call,
    Custom,
};

/// The verb of an action statement.
struct Action {
    ActionKind kind = ActionKind::Send;
    std::string custom_name; ///< Set only for `ActionKind::Custom`.

    /// Maps a verb word to an action, case-insensitively.
    ///
    /// Singular and plural forms (`send`/`sends`, `process`/`processes`) map
    /// to the same kind. Unknown words become `Custom` with the word as given.
    [[nodiscard]] static auto from_verb(std::string_view word) -> Action;

    /// Canonical lowercase verb ("send"), or the custom word.
    [[nodiscard]] auto name() const -> std::string;

    [[nodiscard]] auto operator==(const Action& other) const -> bool = default;
};

/// An external integration attached with `using`/`with`.
struct ServiceCall {
    std::string name; ///< Always from a `Service` token, e.g. "SendGrid".
    std::optional<std::string> method;
    std::map<std::string, Expr> config;
    SourceSpan span;
};

// ============================================================================
// Statements
// ============================================================================

/// `verb target? (using|with Service)?`
struct ActionStatement {
    Action action;
    std::optional<Expr> target;
    std::optional<ServiceCall> service;
    std::map<std::string, Expr> parameters;
    SourceSpan span;
};

/// `(if|when) condition then action* (else action*)?`
struct ConditionalStatement {
    Condition condition;
    std::vector<ActionStatement> then_actions;
    std::optional<std::vector<ActionStatement>> else_actions;
    SourceSpan span;
};

/// `name: expression`
struct AssignmentStatement {
    std::string variable;
    Expr value;
    SourceSpan span;
};

/// Free-text comment carried into generated code.
struct CommentStatement {
    std::string text;
    SourceSpan span;
};

/// A statement node.
struct Stmt {
    std::variant<ActionStatement, ConditionalStatement, AssignmentStatement, CommentStatement>
        kind;
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

#endif // TALKPP_PARSER_AST_STMTS_HPP
