//! # Source Text Management
//!
//! This module provides the source text representation used by the lexer and
//! by diagnostics. It owns the text, tracks line starts, and converts byte
//! offsets to line/column positions.
//!
//! ## Features
//!
//! - **UTF-8 aware columns**: Columns count characters, not bytes
//! - **Line tracking**: O(log n) line lookup from byte offsets
//! - **Error reporting**: Provides line content for diagnostic messages
//!
//! ## Example
//!
//! ```cpp
//! Source source = Source::from_string("when payment fails then call support");
//! SourceLocation loc = source.location(5); // line 1, column 6
//! std::string_view line = source.line(1);
//! ```

#ifndef TALKPP_LEXER_SOURCE_HPP
#define TALKPP_LEXER_SOURCE_HPP

#include "common.hpp"
#include "error.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace talkpp::lexer {

/// A Talk++ program text with location tracking.
///
/// String views returned by `content()`, `slice()` and `line()` are valid as
/// long as the Source object exists.
class Source {
public:
    /// Constructs a source from a filename and content.
    Source(std::string filename, std::string content);

    [[nodiscard]] auto content() const -> std::string_view {
        return content_;
    }

    [[nodiscard]] auto filename() const -> std::string_view {
        return filename_;
    }

    [[nodiscard]] auto length() const -> size_t {
        return content_.size();
    }

    /// Returns the byte at the given offset, or '\0' past the end.
    [[nodiscard]] auto at(size_t offset) const -> char;

    /// Returns a substring from `start` to `end` (exclusive), clamped.
    [[nodiscard]] auto slice(size_t start, size_t end) const -> std::string_view;

    /// Converts a byte offset to a 1-based line and character column.
    [[nodiscard]] auto location(size_t offset) const -> SourceLocation;

    /// Returns the content of a line (1-indexed) without its line terminator.
    [[nodiscard]] auto line(uint32_t line_num) const -> std::string_view;

    [[nodiscard]] auto line_count() const -> uint32_t;

    /// Loads a source file from disk.
    [[nodiscard]] static auto from_file(const std::string& path) -> Result<Source, IoError>;

    /// Creates a source from an in-memory string.
    [[nodiscard]] static auto from_string(std::string content, std::string name = "<input>")
        -> Source;

private:
    std::string filename_;
    std::string content_;
    std::vector<size_t> line_offsets_; ///< Byte offset of each line start.

    void build_line_index();
};

} // namespace talkpp::lexer

#endif // TALKPP_LEXER_SOURCE_HPP
