//! # Rust Backend
//!
//! Emits an async Rust module built on serde and tracing. In debug mode a
//! `#[tokio::main]` bootstrap is appended so the output runs standalone.

#include "targets.hpp"

#include <array>
#include <cstdio>

namespace talkpp::codegen {

namespace {

constexpr std::array<std::string_view, 38> RUST_KEYWORDS = {
    "as",     "async", "await", "break", "const",  "continue", "dyn",    "else",
    "enum",   "extern", "false", "fn",   "for",    "if",       "impl",   "in",
    "let",    "loop",  "match", "mod",   "move",   "mut",      "pub",    "ref",
    "return", "static", "struct", "trait", "true", "type",     "unsafe", "use",
    "where",  "while", "abstract", "become", "yield", "try"};

// Keywords that cannot be written as raw identifiers
constexpr std::array<std::string_view, 4> RUST_RESERVED = {"self", "super", "crate", "Self"};

// Names in scope inside the generated handler
constexpr std::array<std::string_view, 5> RUST_HANDLER_NAMES = {"event", "handler", "main",
                                                                "Event", "Response"};

} // anonymous namespace

// ============================================================================
// Program structure
// ============================================================================

void RustBackend::emit_prelude(CodeWriter& out, const CodegenConfig& /*config*/) const {
    out.line(comment(generated_banner(language())));
    out.line("#![allow(unused)]");
    out.blank();
    out.block(R"(use serde::{Deserialize, Serialize};
use serde_json::Value;
use std::collections::HashMap;

#[derive(Debug, Clone, Serialize, Deserialize)]
pub struct Event {
    pub data: Value,
    pub context: HashMap<String, String>,
}

#[derive(Debug, Clone, Serialize, Deserialize)]
pub struct Response {
    pub success: bool,
    pub data: Value,
    pub message: String,
}

impl Response {
    pub fn success(data: Value) -> Self {
        Self {
            success: true,
            data,
            message: "Function executed successfully".to_string(),
        }
    }

    pub fn error(message: impl Into<String>) -> Self {
        Self {
            success: false,
            data: Value::Null,
            message: message.into(),
        }
    }
})");
    out.blank();
}

void RustBackend::emit_service_stub(CodeWriter& out, const ServiceTemplate& service) const {
    out.line(comment(service.banner));
    out.line("async fn " + std::string(service.stub) + "(target: &str) -> Result<(), String> {");
    out.indent();
    out.line("tracing::debug!(\"" + std::string(service.stub) + "({})\", target);");
    out.line("Ok(())");
    out.dedent();
    out.line("}");
    out.blank();
}

void RustBackend::emit_handler_open(CodeWriter& out, const CodegenConfig& config) const {
    out.line("pub async fn handler(event: Event) -> Response {");
    out.indent();
    if (config.debug_mode) {
        out.line("tracing::info!(\"Handler invoked with event: {:?}\", event);");
    }
}

void RustBackend::emit_handler_close(CodeWriter& out) const {
    out.line("Response::success(serde_json::json!({\"status\": \"completed\"}))");
    out.dedent();
    out.line("}");
}

void RustBackend::emit_epilogue(CodeWriter& out, const CodegenConfig& config) const {
    if (!config.debug_mode) {
        return;
    }
    out.blank();
    out.block(R"(#[tokio::main]
async fn main() {
    tracing_subscriber::fmt::init();

    let event = Event {
        data: serde_json::json!({}),
        context: HashMap::new(),
    };

    let response = handler(event).await;
    match serde_json::to_string_pretty(&response) {
        Ok(text) => println!("{}", text),
        Err(e) => eprintln!("failed to serialize response: {}", e),
    }
})");
}

// ============================================================================
// Comments and conditions
// ============================================================================

auto RustBackend::comment(std::string_view text) const -> std::string {
    return "// " + comment_text(text);
}

auto RustBackend::event_test(std::string_view tag) const -> std::string {
    return "event.data.get(\"type\").and_then(|v| v.as_str()) == Some(" + string_literal(tag) +
           ")";
}

auto RustBackend::comparison(std::string_view left, parser::ComparisonOp op,
                             std::string_view right) const -> std::string {
    return std::string(left) + " " + std::string(parser::comparison_op_symbol(op)) + " " +
           std::string(right);
}

auto RustBackend::logical(std::string_view left, parser::LogicalOp op,
                          std::string_view right) const -> std::string {
    auto symbol = op == parser::LogicalOp::And ? " && " : " || ";
    return "(" + std::string(left) + ")" + symbol + "(" + std::string(right) + ")";
}

auto RustBackend::if_open(std::string_view condition) const -> std::string {
    return "if " + std::string(condition) + " {";
}

auto RustBackend::else_line() const -> std::string {
    return "} else {";
}

auto RustBackend::block_close() const -> std::optional<std::string> {
    return "}";
}

// ============================================================================
// Actions
// ============================================================================

void RustBackend::emit_service_call(CodeWriter& out, const ServiceTemplate& service,
                                    std::string_view argument) const {
    out.line(comment(service.banner));
    out.line("tracing::info!(" + string_literal(service.start_message) + ");");
    out.line("if let Err(e) = " + std::string(service.stub) + "(" + std::string(argument) +
             ").await {");
    out.indent();
    out.line("tracing::error!(\"" + std::string(service.failure_message) + ": {}\", e);");
    out.line("return Response::error(" + string_literal(service.failure_message) + ");");
    out.dedent();
    out.line("}");
}

void RustBackend::emit_unknown_service(CodeWriter& out, std::string_view name) const {
    out.line(comment("WARNING: service '" + std::string(name) + "' is not registered"));
    out.line("tracing::warn!(\"Service {} not implemented\", " + string_literal(name) + ");");
}

// ============================================================================
// Values
// ============================================================================

auto RustBackend::string_literal(std::string_view value) const -> std::string {
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
        case '\0':
            result += "\\0";
            break;
        default:
            if (c < 0x20 || c == 0x7F) {
                char buf[16];
                std::snprintf(buf, sizeof(buf), "\\u{%02x}", c);
                result += buf;
            } else {
                result += static_cast<char>(c);
            }
        }
    }
    result += '"';
    return result;
}

auto RustBackend::int_literal(int64_t value) const -> std::string {
    return std::to_string(value) + "_i64";
}

auto RustBackend::bool_literal(bool value) const -> std::string {
    return value ? "true" : "false";
}

auto RustBackend::identifier(std::string_view name) const -> std::string {
    for (auto reserved : RUST_RESERVED) {
        if (name == reserved) {
            return std::string(name) + "_";
        }
    }
    for (auto taken : RUST_HANDLER_NAMES) {
        if (name == taken) {
            return std::string(name) + "_";
        }
    }
    if (is_service_stub(name)) {
        return std::string(name) + "_";
    }
    for (auto keyword : RUST_KEYWORDS) {
        if (name == keyword) {
            return "r#" + std::string(name);
        }
    }
    return std::string(name);
}

auto RustBackend::binding(std::string_view name, std::string_view value) const -> std::string {
    return "let " + std::string(name) + " = " + std::string(value) + ";";
}

auto RustBackend::empty_binding(std::string_view name) const -> std::string {
    return "let " + std::string(name) + ": Option<Value> = None;";
}

} // namespace talkpp::codegen
