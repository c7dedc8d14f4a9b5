//! # Source Text
//!
//! Line indexing and offset-to-position mapping for Talk++ programs. Lines
//! end at `\n`; a `\r` before it belongs to the terminator, not the line.

#include "lexer/source.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>

namespace talkpp::lexer {

namespace {

auto is_continuation_byte(char c) -> bool {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

} // anonymous namespace

Source::Source(std::string filename, std::string content)
    : filename_(std::move(filename)), content_(std::move(content)) {
    build_line_index();
}

void Source::build_line_index() {
    line_offsets_.assign(1, 0);
    for (auto nl = content_.find('\n'); nl != std::string::npos;
         nl = content_.find('\n', nl + 1)) {
        line_offsets_.push_back(nl + 1);
    }
}

auto Source::at(size_t offset) const -> char {
    return offset < content_.size() ? content_[offset] : '\0';
}

auto Source::slice(size_t start, size_t end) const -> std::string_view {
    std::string_view text = content_;
    if (start >= text.size() || end <= start) {
        return {};
    }
    return text.substr(start, std::min(end, text.size()) - start);
}

auto Source::location(size_t offset) const -> SourceLocation {
    offset = std::min(offset, content_.size());

    // Last line starting at or before the offset
    auto next_line = std::upper_bound(line_offsets_.begin(), line_offsets_.end(), offset);
    auto line_index = static_cast<uint32_t>(std::distance(line_offsets_.begin(), next_line) - 1);

    auto first = content_.begin() + static_cast<std::ptrdiff_t>(line_offsets_[line_index]);
    auto last = content_.begin() + static_cast<std::ptrdiff_t>(offset);
    auto characters = std::count_if(first, last, [](char c) { return !is_continuation_byte(c); });

    return SourceLocation{.line = line_index + 1,
                          .column = static_cast<uint32_t>(characters) + 1,
                          .offset = static_cast<uint32_t>(offset),
                          .length = 0};
}

auto Source::line(uint32_t line_num) const -> std::string_view {
    if (line_num == 0 || line_num > line_offsets_.size()) {
        return {};
    }

    size_t start = line_offsets_[line_num - 1];
    size_t end = line_num < line_offsets_.size() ? line_offsets_[line_num] - 1 : content_.size();
    if (end > start && content_[end - 1] == '\r') {
        --end;
    }
    return std::string_view(content_).substr(start, end - start);
}

auto Source::line_count() const -> uint32_t {
    return static_cast<uint32_t>(line_offsets_.size());
}

auto Source::from_file(const std::string& path) -> Result<Source, IoError> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return IoError{.path = path, .message = std::strerror(errno)};
    }

    std::string content{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    if (file.bad()) {
        return IoError{.path = path, .message = "read failed"};
    }
    return Source(path, std::move(content));
}

auto Source::from_string(std::string content, std::string name) -> Source {
    return Source(std::move(name), std::move(content));
}

} // namespace talkpp::lexer
