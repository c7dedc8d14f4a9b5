//! # JavaScript Backend
//!
//! Emits a CommonJS module with `Event`/`Response` classes. Integers outside
//! the safe range are written as BigInt literals.

#include "targets.hpp"

#include <array>
#include <cstdio>

namespace talkpp::codegen {

namespace {

constexpr int64_t MAX_SAFE_INTEGER = 9007199254740991;

constexpr std::array<std::string_view, 44> JS_RESERVED = {
    "await",   "break",    "case",      "catch",  "class",   "const",     "continue",
    "debugger", "default", "delete",    "do",     "else",    "enum",      "export",
    "extends", "false",    "finally",   "for",    "function", "if",       "implements",
    "import",  "in",       "instanceof", "interface", "let", "new",       "null",
    "package", "private",  "protected", "public", "return",  "static",    "super",
    "switch",  "this",     "throw",     "true",   "try",     "typeof",    "var",
    "void",    "while"};

// Globals and handler names a `let` in the handler body would shadow
constexpr std::array<std::string_view, 6> JS_HANDLER_NAMES = {"event", "handler", "console",
                                                              "JSON",  "Event",   "Response"};

} // anonymous namespace

void JavaScriptBackend::emit_prelude(CodeWriter& out, const CodegenConfig& /*config*/) const {
    out.line(comment(generated_banner(language())));
    out.block(R"('use strict';

class Event {
  constructor(data = {}, context = {}) {
    this.data = data;
    this.context = context;
  }
}

class Response {
  constructor(success, data, message) {
    this.success = success;
    this.data = data;
    this.message = message;
  }

  static success(data) {
    return new Response(true, data, 'Function executed successfully');
  }

  static error(message) {
    return new Response(false, null, message);
  }
})");
    out.blank();
}

void JavaScriptBackend::emit_service_stub(CodeWriter& out, const ServiceTemplate& service) const {
    out.line(comment(service.banner));
    out.line("async function " + std::string(service.stub) + "(target) {");
    out.indent();
    out.line("console.debug('" + std::string(service.stub) + "(%s)', target);");
    out.dedent();
    out.line("}");
    out.blank();
}

void JavaScriptBackend::emit_handler_open(CodeWriter& out, const CodegenConfig& /*config*/) const {
    out.line("async function handler(event) {");
    out.indent();
    out.line("console.info('Handler invoked with event:', JSON.stringify(event));");
}

void JavaScriptBackend::emit_handler_close(CodeWriter& out) const {
    out.line("return Response.success({ status: 'completed' });");
    out.dedent();
    out.line("}");
}

void JavaScriptBackend::emit_epilogue(CodeWriter& out, const CodegenConfig& /*config*/) const {
    out.blank();
    out.block(R"(module.exports = { Event, Response, handler };

if (require.main === module) {
  handler(new Event()).then((response) => {
    console.log(JSON.stringify(response, null, 2));
  });
})");
}

auto JavaScriptBackend::comment(std::string_view text) const -> std::string {
    return "// " + comment_text(text);
}

auto JavaScriptBackend::event_test(std::string_view tag) const -> std::string {
    return "(event.data || {}).type === " + string_literal(tag);
}

auto JavaScriptBackend::comparison(std::string_view left, parser::ComparisonOp op,
                                   std::string_view right) const -> std::string {
    std::string symbol(parser::comparison_op_symbol(op));
    if (op == parser::ComparisonOp::Equal) {
        symbol = "===";
    } else if (op == parser::ComparisonOp::NotEqual) {
        symbol = "!==";
    }
    return std::string(left) + " " + symbol + " " + std::string(right);
}

auto JavaScriptBackend::logical(std::string_view left, parser::LogicalOp op,
                                std::string_view right) const -> std::string {
    auto symbol = op == parser::LogicalOp::And ? " && " : " || ";
    return "(" + std::string(left) + ")" + symbol + "(" + std::string(right) + ")";
}

auto JavaScriptBackend::if_open(std::string_view condition) const -> std::string {
    return "if (" + std::string(condition) + ") {";
}

auto JavaScriptBackend::else_line() const -> std::string {
    return "} else {";
}

auto JavaScriptBackend::block_close() const -> std::optional<std::string> {
    return "}";
}

void JavaScriptBackend::emit_service_call(CodeWriter& out, const ServiceTemplate& service,
                                          std::string_view argument) const {
    out.line(comment(service.banner));
    out.line("console.info(" + string_literal(service.start_message) + ");");
    out.line("try {");
    out.indent();
    out.line("await " + std::string(service.stub) + "(" + std::string(argument) + ");");
    out.dedent();
    out.line("} catch (e) {");
    out.indent();
    out.line("console.error(" + string_literal(std::string(service.failure_message) + ":") +
             ", e);");
    out.line("return Response.error(" + string_literal(service.failure_message) + ");");
    out.dedent();
    out.line("}");
}

void JavaScriptBackend::emit_unknown_service(CodeWriter& out, std::string_view name) const {
    out.line(comment("WARNING: service '" + std::string(name) + "' is not registered"));
    out.line("console.warn('Service %s not implemented', " + string_literal(name) + ");");
}

auto JavaScriptBackend::string_literal(std::string_view value) const -> std::string {
    std::string result = "\"";
    for (unsigned char c : value) {
        switch (c) {
        case '"':
            result += "\\\"";
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
    result += '"';
    return result;
}

auto JavaScriptBackend::int_literal(int64_t value) const -> std::string {
    if (value > MAX_SAFE_INTEGER || value < -MAX_SAFE_INTEGER) {
        return std::to_string(value) + "n";
    }
    return std::to_string(value);
}

auto JavaScriptBackend::bool_literal(bool value) const -> std::string {
    return value ? "true" : "false";
}

auto JavaScriptBackend::identifier(std::string_view name) const -> std::string {
    for (auto reserved : JS_RESERVED) {
        if (name == reserved) {
            return std::string(name) + "_";
        }
    }
    for (auto taken : JS_HANDLER_NAMES) {
        if (name == taken) {
            return std::string(name) + "_";
        }
    }
    if (is_service_stub(name)) {
        return std::string(name) + "_";
    }
    return std::string(name);
}

auto JavaScriptBackend::binding(std::string_view name, std::string_view value) const
    -> std::string {
    return "let " + std::string(name) + " = " + std::string(value) + ";";
}

auto JavaScriptBackend::empty_binding(std::string_view name) const -> std::string {
    return "let " + std::string(name) + " = null;";
}

auto JavaScriptBackend::rebinding(std::string_view name, std::string_view value) const
    -> std::string {
    return std::string(name) + " = " + std::string(value) + ";";
}

auto JavaScriptBackend::empty_rebinding(std::string_view name) const -> std::string {
    return std::string(name) + " = null;";
}

} // namespace talkpp::codegen
