//! # Target Backend Shared Code
//!
//! `CodeWriter`, the default implementations of `TargetBackend` and the
//! backend factory.

#include "codegen/backend.hpp"

#include "common.hpp"
#include "targets/targets.hpp"

#include <charconv>
#include <cmath>

namespace talkpp::codegen {

// ============================================================================
// CodeWriter
// ============================================================================

void CodeWriter::line(std::string_view text) {
    if (!text.empty()) {
        for (int i = 0; i < depth_; ++i) {
            output_ += indent_unit_;
        }
        output_ += text;
    }
    output_ += '\n';
}

void CodeWriter::blank() {
    output_ += '\n';
}

void CodeWriter::block(std::string_view text) {
    size_t start = 0;
    while (start <= text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string_view::npos) {
            if (start < text.size()) {
                line(text.substr(start));
            }
            break;
        }
        line(text.substr(start, end - start));
        start = end + 1;
    }
}

// ============================================================================
// TargetBackend defaults
// ============================================================================

void TargetBackend::emit_placeholder(CodeWriter& out, std::string_view text) const {
    out.line(comment(text));
}

auto TargetBackend::int_literal(int64_t value) const -> std::string {
    return std::to_string(value);
}

auto TargetBackend::float_literal(double value) const -> std::string {
    return format_float(value);
}

// ============================================================================
// Factory and helpers
// ============================================================================

auto create_backend(TargetLanguage language) -> std::unique_ptr<TargetBackend> {
    switch (language) {
    case TargetLanguage::Rust:
        return std::make_unique<RustBackend>();
    case TargetLanguage::Python:
        return std::make_unique<PythonBackend>();
    case TargetLanguage::JavaScript:
        return std::make_unique<JavaScriptBackend>();
    case TargetLanguage::TypeScript:
        return std::make_unique<TypeScriptBackend>();
    case TargetLanguage::Bash:
        return std::make_unique<BashBackend>();
    }
    return std::make_unique<RustBackend>();
}

auto format_float(double value) -> std::string {
    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc{}) {
        return std::to_string(value);
    }
    std::string text(buf, ptr);
    if (text.find_first_of(".eE") == std::string::npos) {
        text += ".0";
    }
    return text;
}

auto comment_text(std::string_view text) -> std::string {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        if (c == '\n' || c == '\r') {
            result += ' ';
        } else {
            result += c;
        }
    }
    return result;
}

auto generated_banner(TargetLanguage language) -> std::string {
    return std::string("Generated by Talk++ ") + VERSION +
           " (target: " + std::string(target_language_name(language)) + ")";
}

} // namespace talkpp::codegen
