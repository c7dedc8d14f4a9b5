#include "diagnostic.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <iomanip>

#include <unistd.h>

namespace talkpp::cli {

// ============================================================================
// Terminal Detection
// ============================================================================

bool terminal_supports_colors() {
    if (!isatty(fileno(stderr)))
        return false;

    const char* term = getenv("TERM");
    if (!term)
        return false;

    return std::string(term) != "dumb";
}

// ============================================================================
// Global Emitter
// ============================================================================

DiagnosticEmitter& get_diagnostic_emitter() {
    static DiagnosticEmitter emitter(std::cerr);
    return emitter;
}

// ============================================================================
// Error Codes
// ============================================================================

const char* error_code(const CompilerError& error) {
    switch (error.error_kind()) {
    case ErrorKind::Lexical:
        return ErrorCodes::LEX_ERROR;
    case ErrorKind::Parse:
        return ErrorCodes::PARSE_ERROR;
    case ErrorKind::CodeGen:
        return ErrorCodes::CODEGEN_ERROR;
    case ErrorKind::Unsupported:
        return ErrorCodes::CODEGEN_UNSUPPORTED;
    case ErrorKind::Io:
        return ErrorCodes::IO_ERROR;
    case ErrorKind::Semantic:
    case ErrorKind::Internal:
        return ErrorCodes::INTERNAL_ERROR;
    }
    return ErrorCodes::INTERNAL_ERROR;
}

// ============================================================================
// DiagnosticEmitter Implementation
// ============================================================================

DiagnosticEmitter::DiagnosticEmitter(std::ostream& out) : out_(out) {
    use_colors_ = terminal_supports_colors();
}

void DiagnosticEmitter::set_source_content(const std::string& path, const std::string& content) {
    source_files_.insert_or_assign(path, lexer::Source::from_string(content, path));
}

std::string DiagnosticEmitter::get_source_line(const std::string& path, uint32_t line) const {
    auto it = source_files_.find(path);
    return it == source_files_.end() ? std::string() : std::string(it->second.line(line));
}

std::string DiagnosticEmitter::severity_string(DiagnosticSeverity sev) const {
    switch (sev) {
    case DiagnosticSeverity::Error:
        return "error";
    case DiagnosticSeverity::Warning:
        return "warning";
    }
    return "unknown";
}

const char* DiagnosticEmitter::severity_color(DiagnosticSeverity sev) const {
    switch (sev) {
    case DiagnosticSeverity::Error:
        return Colors::BrightRed;
    case DiagnosticSeverity::Warning:
        return Colors::BrightYellow;
    }
    return Colors::Reset;
}

void DiagnosticEmitter::emit_header(const Diagnostic& diag) {
    // Format: error[P001]: message
    out_ << color(Colors::Bold) << color(severity_color(diag.severity))
         << severity_string(diag.severity);

    if (!diag.code.empty()) {
        out_ << "[" << diag.code << "]";
    }

    out_ << color(Colors::Reset) << color(Colors::Bold) << ": " << diag.message
         << color(Colors::Reset) << "\n";
}

void DiagnosticEmitter::emit_source_snippet(const std::string& file, const SourceSpan& span) {
    // Location line: --> file:line:column
    out_ << color(Colors::BrightBlue) << "  --> " << color(Colors::Reset) << file << ":"
         << span.start.line << ":" << span.start.column << "\n";

    std::string source_line = get_source_line(file, span.start.line);
    if (source_line.empty()) {
        return;
    }

    int line_width = std::max(static_cast<int>(std::to_string(span.start.line).length()), 4);

    out_ << color(Colors::BrightBlue) << std::setw(line_width) << "" << " |" << color(Colors::Reset)
         << "\n";
    out_ << color(Colors::BrightBlue) << std::setw(line_width) << span.start.line << " | "
         << color(Colors::Reset) << source_line << "\n";

    // Columns count code points; find the byte where the caret starts
    size_t byte = 0;
    uint32_t column = 1;
    while (byte < source_line.size() && column < span.start.column) {
        ++byte;
        while (byte < source_line.size() &&
               (static_cast<unsigned char>(source_line[byte]) & 0xC0) == 0x80) {
            ++byte;
        }
        ++column;
    }

    // Underline the span on this line, or the word under the caret
    size_t width = 1;
    if (span.end.line == span.start.line && span.end.column > span.start.column) {
        width = span.end.column - span.start.column;
    } else {
        size_t end = byte;
        while (end < source_line.size() &&
               !std::isspace(static_cast<unsigned char>(source_line[end]))) {
            ++end;
        }
        width = std::max<size_t>(end - byte, 1);
    }

    out_ << color(Colors::BrightBlue) << std::setw(line_width) << "" << " | "
         << color(Colors::Reset) << std::string(column - 1, ' ') << color(Colors::BrightRed)
         << std::string(width, '^') << color(Colors::Reset) << "\n";

    out_ << color(Colors::BrightBlue) << std::setw(line_width) << "" << " |" << color(Colors::Reset)
         << "\n";
}

void DiagnosticEmitter::emit_notes(const std::vector<std::string>& notes) {
    for (const auto& note : notes) {
        out_ << color(Colors::BrightCyan) << "  = note" << color(Colors::Reset) << ": " << note
             << "\n";
    }
}

void DiagnosticEmitter::emit(const Diagnostic& diag) {
    if (diag.severity == DiagnosticSeverity::Error) {
        error_count_++;
    } else {
        warning_count_++;
    }

    emit_header(diag);
    if (diag.span) {
        emit_source_snippet(diag.file, *diag.span);
    } else if (!diag.file.empty()) {
        out_ << color(Colors::BrightBlue) << "  --> " << color(Colors::Reset) << diag.file
             << "\n";
    }
    emit_notes(diag.notes);
}

void DiagnosticEmitter::error(const std::string& code, const std::string& message,
                              const std::string& file, std::optional<SourceSpan> span,
                              const std::vector<std::string>& notes) {
    emit(Diagnostic{.severity = DiagnosticSeverity::Error,
                    .code = code,
                    .message = message,
                    .file = file,
                    .span = span,
                    .notes = notes});
}

void DiagnosticEmitter::warning(const std::string& code, const std::string& message,
                                const std::string& file, std::optional<SourceSpan> span,
                                const std::vector<std::string>& notes) {
    emit(Diagnostic{.severity = DiagnosticSeverity::Warning,
                    .code = code,
                    .message = message,
                    .file = file,
                    .span = span,
                    .notes = notes});
}

std::optional<SourceSpan> DiagnosticEmitter::span_for(const std::string& file,
                                                      const CompilerError& error) const {
    if (error.is<LexicalError>()) {
        auto it = source_files_.find(file);
        if (it == source_files_.end()) {
            return std::nullopt;
        }
        auto loc = it->second.location(error.as<LexicalError>().position);
        return SourceSpan{loc, loc};
    }

    if (auto pos = error.line_column()) {
        SourceLocation loc{.line = pos->first, .column = pos->second, .offset = 0, .length = 0};
        return SourceSpan{loc, loc};
    }
    return std::nullopt;
}

void DiagnosticEmitter::emit_compiler_error(const std::string& file, const CompilerError& error) {
    Diagnostic diag;
    diag.severity = DiagnosticSeverity::Error;
    diag.code = error_code(error);
    diag.message = error.is<UnsupportedFeature>()
                       ? "Unsupported feature: " + error.as<UnsupportedFeature>().feature
                       : error.message();
    diag.file = error.is<IoError>() ? error.as<IoError>().path : file;
    diag.span = span_for(file, error);

    if (error.is<UnsupportedFeature>()) {
        diag.notes.push_back("no target language can express this construct yet");
    } else if (error.is<InternalError>()) {
        diag.notes.push_back("this is a compiler bug");
    }

    emit(diag);
}

// ============================================================================
// "Did You Mean?" Suggestions
// ============================================================================

size_t levenshtein_distance(std::string_view s1, std::string_view s2) {
    const size_t m = s1.length();
    const size_t n = s2.length();

    if (m == 0)
        return n;
    if (n == 0)
        return m;

    std::vector<size_t> prev_row(n + 1);
    std::vector<size_t> curr_row(n + 1);

    for (size_t j = 0; j <= n; ++j) {
        prev_row[j] = j;
    }

    for (size_t i = 1; i <= m; ++i) {
        curr_row[0] = i;

        for (size_t j = 1; j <= n; ++j) {
            // Case-insensitive comparison
            char c1 = static_cast<char>(std::tolower(static_cast<unsigned char>(s1[i - 1])));
            char c2 = static_cast<char>(std::tolower(static_cast<unsigned char>(s2[j - 1])));

            size_t cost = (c1 == c2) ? 0 : 1;

            curr_row[j] = std::min({prev_row[j] + 1,          // deletion
                                    curr_row[j - 1] + 1,      // insertion
                                    prev_row[j - 1] + cost}); // substitution
        }

        std::swap(prev_row, curr_row);
    }

    return prev_row[n];
}

std::string find_similar(std::string_view input, const std::vector<std::string>& candidates,
                         size_t max_distance) {
    if (input.empty() || candidates.empty()) {
        return "";
    }

    std::string best_match;
    size_t best_distance = max_distance + 1;

    for (const auto& candidate : candidates) {
        size_t len_diff = input.length() > candidate.length() ? input.length() - candidate.length()
                                                              : candidate.length() - input.length();
        if (len_diff > max_distance) {
            continue;
        }

        size_t dist = levenshtein_distance(input, candidate);
        if (dist < best_distance) {
            best_distance = dist;
            best_match = candidate;
        }
    }

    return best_match;
}

} // namespace talkpp::cli
