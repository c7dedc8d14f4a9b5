//! # Diagnostic System Interface
//!
//! This header defines how compiler errors are shown to the user.
//!
//! ## Error Code Categories
//!
//! | Code | Category    | Source                         |
//! |------|-------------|--------------------------------|
//! | L001 | Lexer       | `LexicalError`                 |
//! | P001 | Parser      | `ParseError`                   |
//! | C001 | Codegen     | `CodeGenError`                 |
//! | C002 | Codegen     | `UnsupportedFeature`           |
//! | E002 | General     | `IoError`                      |
//! | E999 | General     | `SemanticError`, `InternalError` |
//!
//! ## Output
//!
//! ```text
//! error[P001]: Expected 'then' after condition
//!   --> rules.tpp:1:23
//!      |
//!    1 | if new user registers validate email
//!      |                       ^^^^^^^^
//!      |
//! ```

#pragma once

#include "common.hpp"
#include "error.hpp"
#include "lexer/source.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace talkpp::cli {

// ============================================================================
// ANSI Color Codes
// ============================================================================

struct Colors {
    static constexpr const char* Reset = "\033[0m";
    static constexpr const char* Bold = "\033[1m";

    static constexpr const char* BrightRed = "\033[91m";
    static constexpr const char* BrightYellow = "\033[93m";
    static constexpr const char* BrightBlue = "\033[94m";
    static constexpr const char* BrightCyan = "\033[96m";
};

// ============================================================================
// Error Codes
// ============================================================================

namespace ErrorCodes {
constexpr const char* LEX_ERROR = "L001";
constexpr const char* PARSE_ERROR = "P001";
constexpr const char* CODEGEN_ERROR = "C001";
constexpr const char* CODEGEN_UNSUPPORTED = "C002";
constexpr const char* IO_ERROR = "E002";
constexpr const char* UNREGISTERED_SERVICE = "W001";
constexpr const char* INTERNAL_ERROR = "E999";
} // namespace ErrorCodes

// Error code for a compiler error
const char* error_code(const CompilerError& error);

// ============================================================================
// Diagnostic Message
// ============================================================================

enum class DiagnosticSeverity {
    Error,
    Warning,
};

struct Diagnostic {
    DiagnosticSeverity severity = DiagnosticSeverity::Error;
    std::string code;    // Error code (e.g., "P001")
    std::string message; // Main error message
    std::string file;    // Empty when the error has no source file
    std::optional<SourceSpan> span;
    std::vector<std::string> notes;
};

// ============================================================================
// Diagnostic Emitter
// ============================================================================

class DiagnosticEmitter {
public:
    explicit DiagnosticEmitter(std::ostream& out = std::cerr);

    // Configuration
    void set_color_enabled(bool enabled) {
        use_colors_ = enabled;
    }
    void set_source_content(const std::string& path, const std::string& content);

    // Emit diagnostics
    void emit(const Diagnostic& diag);

    // Convenience methods for quick diagnostics
    void error(const std::string& code, const std::string& message, const std::string& file,
               std::optional<SourceSpan> span, const std::vector<std::string>& notes = {});

    void warning(const std::string& code, const std::string& message, const std::string& file,
                 std::optional<SourceSpan> span, const std::vector<std::string>& notes = {});

    // Renders any pipeline error with its code and, where known, its position
    void emit_compiler_error(const std::string& file, const CompilerError& error);

    // Statistics
    size_t error_count() const {
        return error_count_;
    }
    size_t warning_count() const {
        return warning_count_;
    }

private:
    std::ostream& out_;
    bool use_colors_ = true;
    std::unordered_map<std::string, lexer::Source> source_files_;
    size_t error_count_ = 0;
    size_t warning_count_ = 0;

    const char* color(const char* code) const {
        return use_colors_ ? code : "";
    }

    void emit_header(const Diagnostic& diag);
    void emit_source_snippet(const std::string& file, const SourceSpan& span);
    void emit_notes(const std::vector<std::string>& notes);

    std::optional<SourceSpan> span_for(const std::string& file, const CompilerError& error) const;
    std::string get_source_line(const std::string& path, uint32_t line) const;
    std::string severity_string(DiagnosticSeverity sev) const;
    const char* severity_color(DiagnosticSeverity sev) const;
};

// ============================================================================
// Global Diagnostic Emitter
// ============================================================================

DiagnosticEmitter& get_diagnostic_emitter();

// Check if stderr is a color terminal
bool terminal_supports_colors();

// ============================================================================
// "Did You Mean?" Suggestions
// ============================================================================

/**
 * Compute Levenshtein (edit) distance between two strings.
 */
size_t levenshtein_distance(std::string_view s1, std::string_view s2);

/**
 * Find the best matching candidate from a list of options.
 * Returns the closest match if within threshold, or empty string if none found.
 */
std::string find_similar(std::string_view input, const std::vector<std::string>& candidates,
                         size_t max_distance = 3);

} // namespace talkpp::cli
