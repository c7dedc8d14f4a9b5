//! # Code Generation Targets
//!
//! Output languages, optimization levels and the generator configuration.
//!
//! | Language     | Names accepted          | Extension |
//! |--------------|-------------------------|-----------|
//! | `Rust`       | `rust`, `rs`            | `rs`      |
//! | `Python`     | `python`, `py`          | `py`      |
//! | `JavaScript` | `javascript`, `js`      | `js`      |
//! | `TypeScript` | `typescript`, `ts`      | `ts`      |
//! | `Bash`       | `bash`, `sh`            | `sh`      |

#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace talkpp::codegen {

// Output language
enum class TargetLanguage {
    Rust,
    Python,
    JavaScript,
    TypeScript,
    Bash,
};

// Optimization level. Accepted and forwarded, not interpreted by generation.
enum class OptimizationLevel {
    Debug,
    Release,
    Size,
};

// Generator configuration
struct CodegenConfig {
    TargetLanguage target_language = TargetLanguage::Rust;
    OptimizationLevel optimization_level = OptimizationLevel::Debug;
    bool debug_mode = true; ///< Rust only: emit a runnable bootstrap around the handler.
};

// All languages in declaration order
constexpr std::array<TargetLanguage, 5> ALL_TARGET_LANGUAGES = {
    TargetLanguage::Rust, TargetLanguage::Python, TargetLanguage::JavaScript,
    TargetLanguage::TypeScript, TargetLanguage::Bash};

// Convert enum to string
auto target_language_name(TargetLanguage language) -> std::string_view;
auto optimization_level_name(OptimizationLevel level) -> std::string_view;

// Parse string to enum (case-insensitive); nullopt for unknown names
auto parse_target_language(std::string_view name) -> std::optional<TargetLanguage>;
auto parse_optimization_level(std::string_view name) -> std::optional<OptimizationLevel>;

} // namespace talkpp::codegen
