//! # Common Definitions
//!
//! This module provides common types, utilities, and constants used throughout
//! the Talk++ compiler. Every pipeline stage depends on it.
//!
//! ## Overview
//!
//! The common module includes:
//!
//! - **Version Information**: Compiler version constants
//! - **Source Locations**: Types for tracking source code positions
//! - **Result Type**: Error handling without exceptions
//! - **Smart Pointers**: Aliases for unique ownership
//!
//! ## Design Philosophy
//!
//! - **No Exceptions**: All errors are returned via `Result<T, E>`
//! - **Explicit Ownership**: Use `Box<T>` for unique ownership of tree nodes

#ifndef TALKPP_COMMON_HPP
#define TALKPP_COMMON_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>

namespace talkpp {

// ============================================================================
// Version Information
// ============================================================================

/// The compiler version string.
constexpr const char* VERSION = "0.2.0";

// ============================================================================
// Source Location Types
// ============================================================================

/// A precise location in source text.
///
/// # Fields
///
/// - `line`: 1-based line number
/// - `column`: 1-based column number, counted in characters (code points)
/// - `offset`: 0-based byte offset from the start of the text
/// - `length`: Length of the source element in bytes
struct SourceLocation {
    /// Line number (1-based).
    uint32_t line = 1;

    /// Column number (1-based, in characters).
    uint32_t column = 1;

    /// Byte offset from start of text (0-based).
    uint32_t offset = 0;

    /// Length of the source element in bytes.
    uint32_t length = 0;

    [[nodiscard]] auto operator==(const SourceLocation& other) const -> bool = default;
};

/// A span of source text from start to end location.
///
/// `end.offset` is exclusive: a token occupies the bytes
/// `[start.offset, end.offset)`.
struct SourceSpan {
    /// Start location of the span.
    SourceLocation start;

    /// End location of the span (exclusive).
    SourceLocation end;

    /// Merges two spans into one that covers both.
    ///
    /// The result spans from the start of `a` to the end of `b`.
    [[nodiscard]] static auto merge(const SourceSpan& a, const SourceSpan& b) -> SourceSpan {
        return {a.start, b.end};
    }

    [[nodiscard]] auto operator==(const SourceSpan& other) const -> bool = default;
};

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// `Result<T, E>` is used for operations that can fail, allowing error
/// handling without exceptions.
///
/// # Example
///
/// ```cpp
/// auto result = lexer::tokenize("send welcome_email");
/// if (is_ok(result)) {
///     auto& tokens = unwrap(result);
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value from a Result.
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

/// Extracts the success value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
///
/// Throws `std::bad_variant_access` if the Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

/// Extracts the error value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Unique ownership pointer.
///
/// Syntax tree nodes own their children through `Box<T>`.
template <typename T> using Box = std::unique_ptr<T>;

/// Creates a new Box containing the given value.
template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

} // namespace talkpp

#endif // TALKPP_COMMON_HPP
