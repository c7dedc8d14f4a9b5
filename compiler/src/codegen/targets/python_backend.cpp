//! # Python Backend
//!
//! Emits an asyncio module with dataclass `Event`/`Response` types.

#include "targets.hpp"

#include <array>
#include <cstdio>

namespace talkpp::codegen {

namespace {

constexpr std::array<std::string_view, 35> PYTHON_KEYWORDS = {
    "False",  "None",   "True",    "and",      "as",       "assert", "async",
    "await",  "break",  "class",   "continue", "def",      "del",    "elif",
    "else",   "except", "finally", "for",      "from",     "global", "if",
    "import", "in",     "is",      "lambda",   "nonlocal", "not",    "or",
    "pass",   "raise",  "return",  "try",      "while",    "with",   "yield"};

// Module and handler names a local binding would shadow
constexpr std::array<std::string_view, 11> PYTHON_HANDLER_NAMES = {
    "event",     "logger", "handler", "asyncio", "json",    "logging",
    "dataclass", "field",  "e",       "Event",   "Response"};

} // anonymous namespace

void PythonBackend::emit_prelude(CodeWriter& out, const CodegenConfig& /*config*/) const {
    out.line(comment(generated_banner(language())));
    out.block(R"(import asyncio
import json
import logging
from dataclasses import dataclass, field
from typing import Any, Dict, Optional

logger = logging.getLogger(__name__)


@dataclass
class Event:
    data: Dict[str, Any] = field(default_factory=dict)
    context: Dict[str, str] = field(default_factory=dict)


@dataclass
class Response:
    success: bool
    data: Optional[Dict[str, Any]] = None
    message: str = ""

    @classmethod
    def ok(cls, data: Dict[str, Any]) -> "Response":
        return cls(success=True, data=data, message="Function executed successfully")

    @classmethod
    def error(cls, message: str) -> "Response":
        return cls(success=False, data=None, message=message))");
    out.blank();
    out.blank();
}

void PythonBackend::emit_service_stub(CodeWriter& out, const ServiceTemplate& service) const {
    out.line(comment(service.banner));
    out.line("async def " + std::string(service.stub) + "(target: str) -> None:");
    out.indent();
    out.line("logger.debug(\"" + std::string(service.stub) + "(%s)\", target)");
    out.dedent();
    out.blank();
    out.blank();
}

void PythonBackend::emit_handler_open(CodeWriter& out, const CodegenConfig& /*config*/) const {
    out.line("async def handler(event: Event) -> Response:");
    out.indent();
    out.line("logger.info(\"Handler invoked with event: %s\", event)");
}

void PythonBackend::emit_handler_close(CodeWriter& out) const {
    out.line("return Response.ok({\"status\": \"completed\"})");
    out.dedent();
}

void PythonBackend::emit_epilogue(CodeWriter& out, const CodegenConfig& /*config*/) const {
    out.blank();
    out.blank();
    out.block(R"(if __name__ == "__main__":
    logging.basicConfig(level=logging.INFO)
    response = asyncio.run(handler(Event()))
    print(json.dumps(response.__dict__, indent=2)))");
}

auto PythonBackend::comment(std::string_view text) const -> std::string {
    return "# " + comment_text(text);
}

auto PythonBackend::event_test(std::string_view tag) const -> std::string {
    return "event.data.get(\"type\") == " + string_literal(tag);
}

auto PythonBackend::comparison(std::string_view left, parser::ComparisonOp op,
                               std::string_view right) const -> std::string {
    return std::string(left) + " " + std::string(parser::comparison_op_symbol(op)) + " " +
           std::string(right);
}

auto PythonBackend::logical(std::string_view left, parser::LogicalOp op,
                            std::string_view right) const -> std::string {
    auto word = op == parser::LogicalOp::And ? " and " : " or ";
    return "(" + std::string(left) + ")" + word + "(" + std::string(right) + ")";
}

auto PythonBackend::if_open(std::string_view condition) const -> std::string {
    return "if " + std::string(condition) + ":";
}

auto PythonBackend::else_line() const -> std::string {
    return "else:";
}

auto PythonBackend::block_close() const -> std::optional<std::string> {
    return std::nullopt;
}

auto PythonBackend::empty_statement() const -> std::optional<std::string> {
    return "pass";
}

void PythonBackend::emit_service_call(CodeWriter& out, const ServiceTemplate& service,
                                      std::string_view argument) const {
    out.line(comment(service.banner));
    out.line("logger.info(" + string_literal(service.start_message) + ")");
    out.line("try:");
    out.indent();
    out.line("await " + std::string(service.stub) + "(" + std::string(argument) + ")");
    out.dedent();
    out.line("except Exception as e:");
    out.indent();
    out.line("logger.error(\"" + std::string(service.failure_message) + ": %s\", e)");
    out.line("return Response.error(" + string_literal(service.failure_message) + ")");
    out.dedent();
}

void PythonBackend::emit_unknown_service(CodeWriter& out, std::string_view name) const {
    out.line(comment("WARNING: service '" + std::string(name) + "' is not registered"));
    out.line("logger.warning(\"Service %s not implemented\", " + string_literal(name) + ")");
}

// A bare comment is not a statement in Python
void PythonBackend::emit_placeholder(CodeWriter& out, std::string_view text) const {
    out.line(comment(text));
    out.line("pass");
}

auto PythonBackend::string_literal(std::string_view value) const -> std::string {
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

auto PythonBackend::bool_literal(bool value) const -> std::string {
    return value ? "True" : "False";
}

auto PythonBackend::identifier(std::string_view name) const -> std::string {
    for (auto keyword : PYTHON_KEYWORDS) {
        if (name == keyword) {
            return std::string(name) + "_";
        }
    }
    for (auto taken : PYTHON_HANDLER_NAMES) {
        if (name == taken) {
            return std::string(name) + "_";
        }
    }
    if (is_service_stub(name)) {
        return std::string(name) + "_";
    }
    return std::string(name);
}

auto PythonBackend::binding(std::string_view name, std::string_view value) const -> std::string {
    return std::string(name) + " = " + std::string(value);
}

auto PythonBackend::empty_binding(std::string_view name) const -> std::string {
    return std::string(name) + " = None";
}

} // namespace talkpp::codegen
