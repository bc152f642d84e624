//! # Source File Management
//!
//! Owns the text of one Dart source file and maps byte offsets to
//! line/column positions for diagnostics.
//!
//! ```cpp
//! auto result = Source::from_file("lib/models/user.dart");
//! if (is_err(result)) { ... }
//! auto source = std::make_unique<Source>(std::move(unwrap(result)));
//! SourceLocation loc = source->location(12);
//! ```
//!
//! `SourceLocation::file` views borrow the filename, so a `Source` must not
//! be moved once locations have been handed out. Callers that lex keep the
//! source in a `std::unique_ptr`.

#ifndef SFG_LEXER_SOURCE_HPP
#define SFG_LEXER_SOURCE_HPP

#include "common.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace sfg::lexer {

/// A Dart source file with an index of line start offsets.
class Source {
public:
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

    /// Byte at `offset`, or '\0' past the end.
    [[nodiscard]] auto at(size_t offset) const -> char;

    /// Substring `[start, end)`, clamped to the content.
    [[nodiscard]] auto slice(size_t start, size_t end) const -> std::string_view;

    /// 1-based line and column of a byte offset (binary search on the line index).
    [[nodiscard]] auto location(size_t offset) const -> SourceLocation;

    /// Text of a 1-based line without its line terminator.
    [[nodiscard]] auto line(uint32_t line_num) const -> std::string_view;

    [[nodiscard]] auto line_count() const -> uint32_t;

    /// Reads a file from disk. The error is a human-readable message.
    [[nodiscard]] static auto from_file(const std::string& path) -> Result<Source, std::string>;

    [[nodiscard]] static auto from_string(std::string content, std::string name = "<input>")
        -> Source;

private:
    std::string filename_;
    std::string content_;
    std::vector<size_t> line_offsets_;

    void build_line_index();
};

} // namespace sfg::lexer

#endif // SFG_LEXER_SOURCE_HPP
