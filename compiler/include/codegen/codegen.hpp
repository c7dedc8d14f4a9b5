//! # Code Generator
//!
//! Turns a parsed `Program` into source text for one target language. The
//! statement-to-snippet mapping lives here and is shared by every target; a
//! `TargetBackend` supplies only surface syntax.
//!
//! ## Output Layout
//!
//! ```text
//! header comment, imports, Event/Response types   (emit_prelude)
//! stub per registered service used                (emit_service_stub)
//! async handler(event)                            (emit_handler_open)
//!     one snippet per statement
//!     success response                            (emit_handler_close)
//! run section                                     (emit_epilogue)
//! ```
//!
//! ## Statement Mapping
//!
//! | Statement             | Snippet                                        |
//! |-----------------------|------------------------------------------------|
//! | Conditional           | `if` / `else` with the rendered condition      |
//! | Action, known service | banner, log, stub call, failure response       |
//! | Action, other service | warning comment and runtime warning            |
//! | Action, no service    | `<Verb> action` comment                        |
//! | Assignment            | local binding of a literal, or empty binding;  |
//! |                       | a name bound earlier is reassigned             |
//! | Comment               | target comment                                 |
//!
//! Generation is deterministic: the same program and config always produce
//! the same bytes.

#pragma once

#include "codegen/backend.hpp"
#include "codegen/target.hpp"
#include "error.hpp"
#include "parser/ast.hpp"

#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace talkpp::codegen {

/// Generates target source from a syntax tree.
///
/// A `CodeGen` holds no per-call state, so one instance may serve any number
/// of `generate()` calls.
class CodeGen {
public:
    explicit CodeGen(CodegenConfig config);

    /// Generates the complete output file, or the first error met.
    [[nodiscard]] auto generate(const parser::Program& program) const
        -> Result<std::string, CompilerError>;

    [[nodiscard]] auto config() const -> const CodegenConfig& {
        return config_;
    }

private:
    CodegenConfig config_;
    std::unique_ptr<TargetBackend> backend_;

    // Escaped names the handler has declared so far
    using BoundNames = std::unordered_set<std::string>;

    // Each emit_* returns the first error, or nullopt once the snippet is written
    auto emit_statement(CodeWriter& out, BoundNames& bound,
                        const parser::Stmt& stmt) const
        -> std::optional<CompilerError>;
    auto emit_conditional(CodeWriter& out, const parser::ConditionalStatement& cond) const
        -> std::optional<CompilerError>;
    auto emit_block(CodeWriter& out, const std::vector<parser::ActionStatement>& actions) const
        -> std::optional<CompilerError>;
    auto emit_action(CodeWriter& out, const parser::ActionStatement& action) const
        -> std::optional<CompilerError>;
    auto emit_assignment(CodeWriter& out, BoundNames& bound,
                         const parser::AssignmentStatement& assign) const
        -> std::optional<CompilerError>;

    auto render_condition(const parser::Condition& cond) const
        -> Result<std::string, CompilerError>;
    auto render_operand(const parser::Expr& expr) const -> Result<std::string, CompilerError>;
    auto render_literal(const parser::Expr& expr) const -> Result<std::string, CompilerError>;
    auto render_target_text(const parser::Expr& expr) const -> Result<std::string, CompilerError>;
};

/// Services from the registry that `program` uses, in registry order.
[[nodiscard]] auto collect_services(const parser::Program& program)
    -> std::vector<const ServiceTemplate*>;

/// Action statements naming a service the registry does not know, in
/// program order.
[[nodiscard]] auto unregistered_services(const parser::Program& program)
    -> std::vector<const parser::ActionStatement*>;

/// Synthesized event tag: subject words joined with `_`, then `_` and the action.
[[nodiscard]] auto event_tag(const parser::EventCondition& event) -> std::string;

/// Convenience wrapper around `CodeGen(config).generate(program)`.
[[nodiscard]] auto generate(const parser::Program& program, const CodegenConfig& config)
    -> Result<std::string, CompilerError>;

} // namespace talkpp::codegen
