//! # Target Backends
//!
//! Concrete backends for the five output languages. Only `create_backend()`
//! constructs these; everything else talks to `TargetBackend`.

#pragma once

#include "codegen/backend.hpp"

namespace talkpp::codegen {

class RustBackend : public TargetBackend {
public:
    [[nodiscard]] auto language() const -> TargetLanguage override {
        return TargetLanguage::Rust;
    }

    void emit_prelude(CodeWriter& out, const CodegenConfig& config) const override;
    void emit_service_stub(CodeWriter& out, const ServiceTemplate& service) const override;
    void emit_handler_open(CodeWriter& out, const CodegenConfig& config) const override;
    void emit_handler_close(CodeWriter& out) const override;
    void emit_epilogue(CodeWriter& out, const CodegenConfig& config) const override;

    [[nodiscard]] auto comment(std::string_view text) const -> std::string override;
    [[nodiscard]] auto event_test(std::string_view tag) const -> std::string override;
    [[nodiscard]] auto comparison(std::string_view left, parser::ComparisonOp op,
                                  std::string_view right) const -> std::string override;
    [[nodiscard]] auto logical(std::string_view left, parser::LogicalOp op,
                               std::string_view right) const -> std::string override;
    [[nodiscard]] auto if_open(std::string_view condition) const -> std::string override;
    [[nodiscard]] auto else_line() const -> std::string override;
    [[nodiscard]] auto block_close() const -> std::optional<std::string> override;

    void emit_service_call(CodeWriter& out, const ServiceTemplate& service,
                           std::string_view argument) const override;
    void emit_unknown_service(CodeWriter& out, std::string_view name) const override;

    [[nodiscard]] auto string_literal(std::string_view value) const -> std::string override;
    [[nodiscard]] auto int_literal(int64_t value) const -> std::string override;
    [[nodiscard]] auto bool_literal(bool value) const -> std::string override;
    [[nodiscard]] auto identifier(std::string_view name) const -> std::string override;
    [[nodiscard]] auto binding(std::string_view name, std::string_view value) const
        -> std::string override;
    [[nodiscard]] auto empty_binding(std::string_view name) const -> std::string override;
};

class PythonBackend : public TargetBackend {
public:
    [[nodiscard]] auto language() const -> TargetLanguage override {
        return TargetLanguage::Python;
    }

    void emit_prelude(CodeWriter& out, const CodegenConfig& config) const override;
    void emit_service_stub(CodeWriter& out, const ServiceTemplate& service) const override;
    void emit_handler_open(CodeWriter& out, const CodegenConfig& config) const override;
    void emit_handler_close(CodeWriter& out) const override;
    void emit_epilogue(CodeWriter& out, const CodegenConfig& config) const override;

    [[nodiscard]] auto comment(std::string_view text) const -> std::string override;
    [[nodiscard]] auto event_test(std::string_view tag) const -> std::string override;
    [[nodiscard]] auto comparison(std::string_view left, parser::ComparisonOp op,
                                  std::string_view right) const -> std::string override;
    [[nodiscard]] auto logical(std::string_view left, parser::LogicalOp op,
                               std::string_view right) const -> std::string override;
    [[nodiscard]] auto if_open(std::string_view condition) const -> std::string override;
    [[nodiscard]] auto else_line() const -> std::string override;
    [[nodiscard]] auto block_close() const -> std::optional<std::string> override;
    [[nodiscard]] auto empty_statement() const -> std::optional<std::string> override;

    void emit_service_call(CodeWriter& out, const ServiceTemplate& service,
                           std::string_view argument) const override;
    void emit_unknown_service(CodeWriter& out, std::string_view name) const override;
    void emit_placeholder(CodeWriter& out, std::string_view text) const override;

    [[nodiscard]] auto string_literal(std::string_view value) const -> std::string override;
    [[nodiscard]] auto bool_literal(bool value) const -> std::string override;
    [[nodiscard]] auto identifier(std::string_view name) const -> std::string override;
    [[nodiscard]] auto binding(std::string_view name, std::string_view value) const
        -> std::string override;
    [[nodiscard]] auto empty_binding(std::string_view name) const -> std::string override;
};

class JavaScriptBackend : public TargetBackend {
public:
    [[nodiscard]] auto language() const -> TargetLanguage override {
        return TargetLanguage::JavaScript;
    }

    [[nodiscard]] auto indent_unit() const -> std::string override {
        return "  ";
    }

    void emit_prelude(CodeWriter& out, const CodegenConfig& config) const override;
    void emit_service_stub(CodeWriter& out, const ServiceTemplate& service) const override;
    void emit_handler_open(CodeWriter& out, const CodegenConfig& config) const override;
    void emit_handler_close(CodeWriter& out) const override;
    void emit_epilogue(CodeWriter& out, const CodegenConfig& config) const override;

    [[nodiscard]] auto comment(std::string_view text) const -> std::string override;
    [[nodiscard]] auto event_test(std::string_view tag) const -> std::string override;
    [[nodiscard]] auto comparison(std::string_view left, parser::ComparisonOp op,
                                  std::string_view right) const -> std::string override;
    [[nodiscard]] auto logical(std::string_view left, parser::LogicalOp op,
                               std::string_view right) const -> std::string override;
    [[nodiscard]] auto if_open(std::string_view condition) const -> std::string override;
    [[nodiscard]] auto else_line() const -> std::string override;
    [[nodiscard]] auto block_close() const -> std::optional<std::string> override;

    void emit_service_call(CodeWriter& out, const ServiceTemplate& service,
                           std::string_view argument) const override;
    void emit_unknown_service(CodeWriter& out, std::string_view name) const override;

    [[nodiscard]] auto string_literal(std::string_view value) const -> std::string override;
    [[nodiscard]] auto int_literal(int64_t value) const -> std::string override;
    [[nodiscard]] auto bool_literal(bool value) const -> std::string override;
    [[nodiscard]] auto identifier(std::string_view name) const -> std::string override;
    [[nodiscard]] auto binding(std::string_view name, std::string_view value) const
        -> std::string override;
    [[nodiscard]] auto empty_binding(std::string_view name) const -> std::string override;
    [[nodiscard]] auto rebinding(std::string_view name, std::string_view value) const
        -> std::string override;
    [[nodiscard]] auto empty_rebinding(std::string_view name) const -> std::string override;
};

// JavaScript with type annotations and ES module exports
class TypeScriptBackend : public JavaScriptBackend {
public:
    [[nodiscard]] auto language() const -> TargetLanguage override {
        return TargetLanguage::TypeScript;
    }

    void emit_prelude(CodeWriter& out, const CodegenConfig& config) const override;
    void emit_service_stub(CodeWriter& out, const ServiceTemplate& service) const override;
    void emit_handler_open(CodeWriter& out, const CodegenConfig& config) const override;
    void emit_epilogue(CodeWriter& out, const CodegenConfig& config) const override;

    [[nodiscard]] auto event_test(std::string_view tag) const -> std::string override;
    [[nodiscard]] auto empty_binding(std::string_view name) const -> std::string override;
};

class BashBackend : public TargetBackend {
public:
    [[nodiscard]] auto language() const -> TargetLanguage override {
        return TargetLanguage::Bash;
    }

    void emit_prelude(CodeWriter& out, const CodegenConfig& config) const override;
    void emit_service_stub(CodeWriter& out, const ServiceTemplate& service) const override;
    void emit_handler_open(CodeWriter& out, const CodegenConfig& config) const override;
    void emit_handler_close(CodeWriter& out) const override;
    void emit_epilogue(CodeWriter& out, const CodegenConfig& config) const override;

    [[nodiscard]] auto comment(std::string_view text) const -> std::string override;
    [[nodiscard]] auto event_test(std::string_view tag) const -> std::string override;
    [[nodiscard]] auto comparison(std::string_view left, parser::ComparisonOp op,
                                  std::string_view right) const -> std::string override;
    [[nodiscard]] auto logical(std::string_view left, parser::LogicalOp op,
                               std::string_view right) const -> std::string override;
    [[nodiscard]] auto if_open(std::string_view condition) const -> std::string override;
    [[nodiscard]] auto else_line() const -> std::string override;
    [[nodiscard]] auto block_close() const -> std::optional<std::string> override;
    [[nodiscard]] auto empty_statement() const -> std::optional<std::string> override;

    void emit_service_call(CodeWriter& out, const ServiceTemplate& service,
                           std::string_view argument) const override;
    void emit_unknown_service(CodeWriter& out, std::string_view name) const override;
    void emit_placeholder(CodeWriter& out, std::string_view text) const override;

    [[nodiscard]] auto string_literal(std::string_view value) const -> std::string override;
    [[nodiscard]] auto bool_literal(bool value) const -> std::string override;
    [[nodiscard]] auto identifier(std::string_view name) const -> std::string override;
    [[nodiscard]] auto variable_reference(std::string_view name) const -> std::string override;
    [[nodiscard]] auto binding(std::string_view name, std::string_view value) const
        -> std::string override;
    [[nodiscard]] auto empty_binding(std::string_view name) const -> std::string override;
};

// Header comment shared by all targets: "Generated by Talk++ <version> (target: <name>)"
auto generated_banner(TargetLanguage language) -> std::string;

} // namespace talkpp::codegen
