//! # TypeScript Backend
//!
//! Shares statement syntax with the JavaScript backend and adds type
//! declarations and ES module exports.

#include "targets.hpp"

namespace talkpp::codegen {

void TypeScriptBackend::emit_prelude(CodeWriter& out, const CodegenConfig& /*config*/) const {
    out.line(comment(generated_banner(language())));
    out.block(R"(export interface Event {
  data: Record<string, unknown>;
  context: Record<string, string>;
}

export class Response {
  constructor(
    public success: boolean,
    public data: Record<string, unknown> | null,
    public message: string,
  ) {}

  static success(data: Record<string, unknown>): Response {
    return new Response(true, data, 'Function executed successfully');
  }

  static error(message: string): Response {
    return new Response(false, null, message);
  }
})");
    out.blank();
}

void TypeScriptBackend::emit_service_stub(CodeWriter& out, const ServiceTemplate& service) const {
    out.line(comment(service.banner));
    out.line("async function " + std::string(service.stub) + "(target: string): Promise<void> {");
    out.indent();
    out.line("console.debug('" + std::string(service.stub) + "(%s)', target);");
    out.dedent();
    out.line("}");
    out.blank();
}

void TypeScriptBackend::emit_handler_open(CodeWriter& out, const CodegenConfig& /*config*/) const {
    out.line("export async function handler(event: Event): Promise<Response> {");
    out.indent();
    out.line("console.info('Handler invoked with event:', JSON.stringify(event));");
}

// Exports are declared inline
void TypeScriptBackend::emit_epilogue(CodeWriter& /*out*/, const CodegenConfig& /*config*/) const {}

auto TypeScriptBackend::event_test(std::string_view tag) const -> std::string {
    return "event.data[\"type\"] === " + string_literal(tag);
}

auto TypeScriptBackend::empty_binding(std::string_view name) const -> std::string {
    return "let " + std::string(name) + ": unknown = null;";
}

} // namespace talkpp::codegen
