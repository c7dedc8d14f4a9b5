//! # Bash Backend
//!
//! Emits a Bash script. The event arrives as JSON in `EVENT_DATA`; the
//! response is printed as JSON by `respond`. Service failures make the
//! handler print an error response and return 1.
//!
//! ## Conditions
//!
//! | Form        | Rendering                                  |
//! |-------------|--------------------------------------------|
//! | Event       | `[[ "$(event_type)" == 'tag' ]]`           |
//! | Comparison  | `[[ L == R ]]`, numeric ops `-gt` etc.     |
//! | Logical     | `{ L; } && { R; }`                         |

#include "targets.hpp"

#include <array>
#include <cstdio>

namespace talkpp::codegen {

namespace {

constexpr std::array<std::string_view, 22> BASH_RESERVED = {
    "if",   "then",     "else",  "elif",   "fi",   "case",  "esac", "for",
    "select", "while",  "until", "do",     "done", "in",    "function", "time",
    "local", "declare", "export", "readonly", "return", "exit"};

// Helpers and globals the generated script defines
constexpr std::array<std::string_view, 5> BASH_HANDLER_NAMES = {
    "respond", "event_type", "handler", "EVENT_DATA", "EVENT_CONTEXT"};

auto bash_test_operator(parser::ComparisonOp op) -> std::string_view {
    switch (op) {
    case parser::ComparisonOp::Equal:
        return "==";
    case parser::ComparisonOp::NotEqual:
        return "!=";
    case parser::ComparisonOp::GreaterThan:
        return "-gt";
    case parser::ComparisonOp::LessThan:
        return "-lt";
    case parser::ComparisonOp::GreaterEqual:
        return "-ge";
    case parser::ComparisonOp::LessEqual:
        return "-le";
    }
    return "==";
}

} // anonymous namespace

void BashBackend::emit_prelude(CodeWriter& out, const CodegenConfig& /*config*/) const {
    out.line("#!/usr/bin/env bash");
    out.line(comment(generated_banner(language())));
    out.block(R"SH(set -euo pipefail

# Event: JSON object in EVENT_DATA, context in EVENT_CONTEXT
if [[ -z "${EVENT_DATA:-}" ]]; then EVENT_DATA='{}'; fi
if [[ -z "${EVENT_CONTEXT:-}" ]]; then EVENT_CONTEXT='{}'; fi

# Response: prints {"success": ..., "data": ..., "message": ...}
respond() {
    local success="$1"
    local message="$2"
    printf '{"success": %s, "data": {"status": "completed"}, "message": "%s"}\n' "${success}" "${message}"
}

event_type() {
    printf '%s' "${EVENT_DATA}" | sed -n 's/.*"type"[[:space:]]*:[[:space:]]*"\([^"]*\)".*/\1/p'
})SH");
    out.blank();
}

void BashBackend::emit_service_stub(CodeWriter& out, const ServiceTemplate& service) const {
    out.line(comment(service.banner));
    out.line(std::string(service.stub) + "() {");
    out.indent();
    out.line("echo \"DEBUG: " + std::string(service.stub) + "($1)\" >&2");
    out.dedent();
    out.line("}");
    out.blank();
}

void BashBackend::emit_handler_open(CodeWriter& out, const CodegenConfig& /*config*/) const {
    out.line("# async handler entry point");
    out.line("handler() {");
    out.indent();
    out.line("echo \"INFO: Handler invoked with event: ${EVENT_DATA}\" >&2");
}

void BashBackend::emit_handler_close(CodeWriter& out) const {
    out.line("respond true 'Function executed successfully'");
    out.dedent();
    out.line("}");
}

void BashBackend::emit_epilogue(CodeWriter& out, const CodegenConfig& /*config*/) const {
    out.blank();
    out.block(R"(if [[ "${BASH_SOURCE[0]}" == "${0}" ]]; then
    handler
fi)");
}

auto BashBackend::comment(std::string_view text) const -> std::string {
    return "# " + comment_text(text);
}

auto BashBackend::event_test(std::string_view tag) const -> std::string {
    return "[[ \"$(event_type)\" == " + string_literal(tag) + " ]]";
}

auto BashBackend::comparison(std::string_view left, parser::ComparisonOp op,
                             std::string_view right) const -> std::string {
    return "[[ " + std::string(left) + " " + std::string(bash_test_operator(op)) + " " +
           std::string(right) + " ]]";
}

auto BashBackend::logical(std::string_view left, parser::LogicalOp op,
                          std::string_view right) const -> std::string {
    auto symbol = op == parser::LogicalOp::And ? " && " : " || ";
    return "{ " + std::string(left) + "; }" + symbol + "{ " + std::string(right) + "; }";
}

auto BashBackend::if_open(std::string_view condition) const -> std::string {
    return "if " + std::string(condition) + "; then";
}

auto BashBackend::else_line() const -> std::string {
    return "else";
}

auto BashBackend::block_close() const -> std::optional<std::string> {
    return "fi";
}

auto BashBackend::empty_statement() const -> std::optional<std::string> {
    return ":";
}

void BashBackend::emit_service_call(CodeWriter& out, const ServiceTemplate& service,
                                    std::string_view argument) const {
    out.line(comment(service.banner));
    out.line("echo " + string_literal("INFO: " + std::string(service.start_message)) + " >&2");
    out.line("if ! " + std::string(service.stub) + " " + std::string(argument) + "; then");
    out.indent();
    out.line("echo " + string_literal("ERROR: " + std::string(service.failure_message)) +
             " >&2");
    out.line("respond false " + string_literal(service.failure_message));
    out.line("return 1");
    out.dedent();
    out.line("fi");
}

void BashBackend::emit_unknown_service(CodeWriter& out, std::string_view name) const {
    out.line(comment("WARNING: service '" + std::string(name) + "' is not registered"));
    out.line("echo " + string_literal("WARN: Service " + std::string(name) + " not implemented") +
             " >&2");
}

// A function body must contain a command
void BashBackend::emit_placeholder(CodeWriter& out, std::string_view text) const {
    out.line(comment(text));
    out.line(":");
}

// Single quotes unless the value holds control characters, which need $'...'
auto BashBackend::string_literal(std::string_view value) const -> std::string {
    bool has_control = false;
    for (unsigned char c : value) {
        if (c < 0x20 || c == 0x7F) {
            has_control = true;
            break;
        }
    }

    if (!has_control) {
        std::string result = "'";
        for (char c : value) {
            if (c == '\'') {
                result += "'\\''";
            } else {
                result += c;
            }
        }
        result += '\'';
        return result;
    }

    std::string result = "$'";
    for (unsigned char c : value) {
        switch (c) {
        case '\'':
            result += "\\'";
            break;
        case '\\':
            result += "\\\\";
            break;
        case '\n':
            result += "\\n";
            break;
        case '\r':
            result += "\\r";
            break;
        case '\t':
            result += "\\t";
            break;
        default:
            if (c < 0x20 || c == 0x7F) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\x%02x", c);
                result += buf;
            } else {
                result += static_cast<char>(c);
            }
        }
    }
    result += '\'';
    return result;
}

auto BashBackend::bool_literal(bool value) const -> std::string {
    return value ? "true" : "false";
}

auto BashBackend::identifier(std::string_view name) const -> std::string {
    for (auto reserved : BASH_RESERVED) {
        if (name == reserved) {
            return std::string(name) + "_";
        }
    }
    for (auto taken : BASH_HANDLER_NAMES) {
        if (name == taken) {
            return std::string(name) + "_";
        }
    }
    if (is_service_stub(name)) {
        return std::string(name) + "_";
    }
    return std::string(name);
}

auto BashBackend::variable_reference(std::string_view name) const -> std::string {
    return "\"${" + identifier(name) + "}\"";
}

auto BashBackend::binding(std::string_view name, std::string_view value) const -> std::string {
    return "local " + std::string(name) + "=" + std::string(value);
}

auto BashBackend::empty_binding(std::string_view name) const -> std::string {
    return "local " + std::string(name) + "=\"\"";
}

} // namespace talkpp::codegen
