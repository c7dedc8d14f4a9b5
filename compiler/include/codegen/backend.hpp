//! # Target Backend Abstraction
//!
//! A target backend knows the surface syntax of one output language. The
//! shared `CodeGen` traversal decides what each statement means and asks the
//! backend how to spell it, so every target maps statements identically.
//!
//! ## Architecture
//!
//! ```text
//!     TargetBackend (abstract)
//!     ├── emit_prelude()        header, imports, Event/Response types
//!     ├── emit_service_stub()   one stub definition per used service
//!     ├── emit_handler_open()   async handler(event) entry point
//!     ├── event_test() / comparison() / logical()
//!     ├── if_open() / else_line() / block_close()
//!     ├── emit_service_call() / emit_unknown_service() / emit_placeholder()
//!     ├── literals, identifiers, bindings
//!     ├── emit_handler_close()  success response
//!     └── emit_epilogue()       run section
//!            │
//!   ┌────────┼──────────┬──────────────┬──────────┐
//!   │        │          │              │          │
//! Rust    Python   JavaScript ─── TypeScript    Bash
//! ```

#pragma once

#include "codegen/services.hpp"
#include "codegen/target.hpp"
#include "parser/ast_common.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace talkpp::codegen {

// Line-oriented output buffer with indentation
class CodeWriter {
public:
    explicit CodeWriter(std::string indent_unit = "    ") : indent_unit_(std::move(indent_unit)) {}

    // Writes one line at the current indentation
    void line(std::string_view text);

    // Writes an empty line
    void blank();

    // Writes each line of `text` at the current indentation
    void block(std::string_view text);

    void indent() {
        ++depth_;
    }

    void dedent() {
        if (depth_ > 0) {
            --depth_;
        }
    }

    [[nodiscard]] auto str() const -> const std::string& {
        return output_;
    }

private:
    std::string indent_unit_;
    std::string output_;
    int depth_ = 0;
};

// Surface syntax of one output language
class TargetBackend {
public:
    virtual ~TargetBackend() = default;

    [[nodiscard]] virtual auto language() const -> TargetLanguage = 0;

    // Indentation unit for this language
    [[nodiscard]] virtual auto indent_unit() const -> std::string {
        return "    ";
    }

    // ------------------------------------------------------------------------
    // Program structure
    // ------------------------------------------------------------------------

    virtual void emit_prelude(CodeWriter& out, const CodegenConfig& config) const = 0;

    virtual void emit_service_stub(CodeWriter& out, const ServiceTemplate& service) const = 0;

    // Opens the handler and indents
    virtual void emit_handler_open(CodeWriter& out, const CodegenConfig& config) const = 0;

    // Emits the success return, dedents and closes the handler
    virtual void emit_handler_close(CodeWriter& out) const = 0;

    virtual void emit_epilogue(CodeWriter& out, const CodegenConfig& config) const = 0;

    // ------------------------------------------------------------------------
    // Comments
    // ------------------------------------------------------------------------

    // One comment line; `text` has no line breaks
    [[nodiscard]] virtual auto comment(std::string_view text) const -> std::string = 0;

    // ------------------------------------------------------------------------
    // Conditions
    // ------------------------------------------------------------------------

    // Tests whether the event's "type" field equals `tag`
    [[nodiscard]] virtual auto event_test(std::string_view tag) const -> std::string = 0;

    [[nodiscard]] virtual auto comparison(std::string_view left, parser::ComparisonOp op,
                                          std::string_view right) const -> std::string = 0;

    // Both operands are parenthesized (or grouped) as given
    [[nodiscard]] virtual auto logical(std::string_view left, parser::LogicalOp op,
                                       std::string_view right) const -> std::string = 0;

    // ------------------------------------------------------------------------
    // Blocks
    // ------------------------------------------------------------------------

    [[nodiscard]] virtual auto if_open(std::string_view condition) const -> std::string = 0;

    [[nodiscard]] virtual auto else_line() const -> std::string = 0;

    // Closing line of an if/else, if the language has one
    [[nodiscard]] virtual auto block_close() const -> std::optional<std::string> = 0;

    // Statement required in a block that would otherwise be empty
    [[nodiscard]] virtual auto empty_statement() const -> std::optional<std::string> {
        return std::nullopt;
    }

    // ------------------------------------------------------------------------
    // Actions
    // ------------------------------------------------------------------------

    // Registered service: banner, info log, stub call, failure branch
    virtual void emit_service_call(CodeWriter& out, const ServiceTemplate& service,
                                   std::string_view argument) const = 0;

    // Unregistered service: warning comment and runtime warning
    virtual void emit_unknown_service(CodeWriter& out, std::string_view name) const = 0;

    // Comment standing in for an action with no service
    virtual void emit_placeholder(CodeWriter& out, std::string_view text) const;

    // ------------------------------------------------------------------------
    // Values
    // ------------------------------------------------------------------------

    [[nodiscard]] virtual auto string_literal(std::string_view value) const -> std::string = 0;

    [[nodiscard]] virtual auto int_literal(int64_t value) const -> std::string;

    // `value` is finite
    [[nodiscard]] virtual auto float_literal(double value) const -> std::string;

    [[nodiscard]] virtual auto bool_literal(bool value) const -> std::string = 0;

    // Escapes names that collide with reserved words or with names the
    // generated handler itself uses (its parameter, logger, stubs)
    [[nodiscard]] virtual auto identifier(std::string_view name) const -> std::string = 0;

    // Reads a local variable inside an expression
    [[nodiscard]] virtual auto variable_reference(std::string_view name) const -> std::string {
        return identifier(name);
    }

    // `name` is already escaped
    [[nodiscard]] virtual auto binding(std::string_view name, std::string_view value) const
        -> std::string = 0;

    // Declares `name` with no value
    [[nodiscard]] virtual auto empty_binding(std::string_view name) const -> std::string = 0;

    // Assigns to a `name` bound earlier in the handler
    [[nodiscard]] virtual auto rebinding(std::string_view name, std::string_view value) const
        -> std::string {
        return binding(name, value);
    }

    [[nodiscard]] virtual auto empty_rebinding(std::string_view name) const -> std::string {
        return empty_binding(name);
    }
};

// Creates the backend for a language
auto create_backend(TargetLanguage language) -> std::unique_ptr<TargetBackend>;

// Shortest decimal text that reads back as `value`, always with '.' or exponent
auto format_float(double value) -> std::string;

// Replaces line breaks so text fits in a single-line comment
auto comment_text(std::string_view text) -> std::string;

} // namespace talkpp::codegen
