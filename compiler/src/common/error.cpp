//! # Compiler Errors
//!
//! Display formatting for `CompilerError`.

#include "error.hpp"

namespace talkpp {

namespace {

// Overload set for std::visit.
template <typename... Ts> struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <typename... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

} // anonymous namespace

auto error_kind_name(ErrorKind kind) -> std::string_view {
    switch (kind) {
    case ErrorKind::Lexical:
        return "lexical error";
    case ErrorKind::Parse:
        return "parse error";
    case ErrorKind::Semantic:
        return "semantic error";
    case ErrorKind::CodeGen:
        return "code generation error";
    case ErrorKind::Unsupported:
        return "unsupported feature";
    case ErrorKind::Internal:
        return "internal compiler error";
    case ErrorKind::Io:
        return "io error";
    }
    return "error";
}

auto CompilerError::error_kind() const -> ErrorKind {
    return std::visit(Overloaded{
                          [](const LexicalError&) { return ErrorKind::Lexical; },
                          [](const ParseError&) { return ErrorKind::Parse; },
                          [](const SemanticError&) { return ErrorKind::Semantic; },
                          [](const CodeGenError&) { return ErrorKind::CodeGen; },
                          [](const UnsupportedFeature&) { return ErrorKind::Unsupported; },
                          [](const InternalError&) { return ErrorKind::Internal; },
                          [](const IoError&) { return ErrorKind::Io; },
                      },
                      kind);
}

auto CompilerError::message() const -> std::string {
    return std::visit(Overloaded{
                          [](const LexicalError& e) { return e.message; },
                          [](const ParseError& e) { return e.message; },
                          [](const SemanticError& e) { return e.message; },
                          [](const CodeGenError& e) { return e.message; },
                          [](const UnsupportedFeature& e) { return e.feature; },
                          [](const InternalError& e) { return e.message; },
                          [](const IoError& e) { return e.path + ": " + e.message; },
                      },
                      kind);
}

auto CompilerError::line_column() const -> std::optional<std::pair<uint32_t, uint32_t>> {
    if (const auto* parse = std::get_if<ParseError>(&kind)) {
        return std::make_pair(parse->line, parse->column);
    }
    return std::nullopt;
}

auto to_string(const CompilerError& error) -> std::string {
    return std::visit(
        Overloaded{
            [](const LexicalError& e) {
                return "Lexical error at position " + std::to_string(e.position) + ": " +
                       e.message;
            },
            [](const ParseError& e) {
                return "Parse error at line " + std::to_string(e.line) + ", column " +
                       std::to_string(e.column) + ": " + e.message;
            },
            [](const SemanticError& e) { return "Semantic error: " + e.message; },
            [](const CodeGenError& e) { return "Code generation error: " + e.message; },
            [](const UnsupportedFeature& e) { return "Unsupported feature: " + e.feature; },
            [](const InternalError& e) { return "Internal compiler error: " + e.message; },
            [](const IoError& e) { return "IO error: " + e.path + ": " + e.message; },
        },
        error.kind);
}

} // namespace talkpp
