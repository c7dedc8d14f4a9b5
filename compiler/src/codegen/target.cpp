#include "codegen/target.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace talkpp::codegen {

namespace {

auto to_lower(std::string_view s) -> std::string {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // anonymous namespace

auto target_language_name(TargetLanguage language) -> std::string_view {
    switch (language) {
    case TargetLanguage::Rust:
        return "rust";
    case TargetLanguage::Python:
        return "python";
    case TargetLanguage::JavaScript:
        return "javascript";
    case TargetLanguage::TypeScript:
        return "typescript";
    case TargetLanguage::Bash:
        return "bash";
    }
    return "rust";
}

auto optimization_level_name(OptimizationLevel level) -> std::string_view {
    switch (level) {
    case OptimizationLevel::Debug:
        return "debug";
    case OptimizationLevel::Release:
        return "release";
    case OptimizationLevel::Size:
        return "size";
    }
    return "debug";
}

auto parse_target_language(std::string_view name) -> std::optional<TargetLanguage> {
    auto lower = to_lower(name);
    if (lower == "rust" || lower == "rs")
        return TargetLanguage::Rust;
    if (lower == "python" || lower == "py")
        return TargetLanguage::Python;
    if (lower == "javascript" || lower == "js")
        return TargetLanguage::JavaScript;
    if (lower == "typescript" || lower == "ts")
        return TargetLanguage::TypeScript;
    if (lower == "bash" || lower == "sh")
        return TargetLanguage::Bash;
    return std::nullopt;
}

auto parse_optimization_level(std::string_view name) -> std::optional<OptimizationLevel> {
    auto lower = to_lower(name);
    if (lower == "debug")
        return OptimizationLevel::Debug;
    if (lower == "release")
        return OptimizationLevel::Release;
    if (lower == "size")
        return OptimizationLevel::Size;
    return std::nullopt;
}

} // namespace talkpp::codegen
