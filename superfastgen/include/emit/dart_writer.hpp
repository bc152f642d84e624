//! # Dart Writer
//!
//! Line-oriented text builder used by all emitters. Indentation is two
//! spaces per level; blank lines never carry trailing whitespace.

#ifndef SFG_EMIT_DART_WRITER_HPP
#define SFG_EMIT_DART_WRITER_HPP

#include <string>
#include <string_view>
#include <vector>

namespace sfg::emit {

/// Column limit of the formatter the generated files follow.
inline constexpr size_t LINE_WIDTH = 80;

class DartWriter {
public:
    /// Writes `text` at the current indentation followed by a newline.
    void emit_line(std::string_view text);

    /// Writes `text` with `extra` spaces on top of the current indentation.
    void emit_line(std::string_view text, size_t extra);

    /// Writes one empty line.
    void emit_blank();

    /// Appends pre-rendered text verbatim.
    void emit_raw(std::string_view text);

    void push_indent() {
        ++indent_level_;
    }
    void pop_indent() {
        if (indent_level_ > 0) {
            --indent_level_;
        }
    }

    [[nodiscard]] auto indent_width() const -> size_t {
        return static_cast<size_t>(indent_level_) * 2;
    }

    /// True when `text` fits on one line at the current indentation.
    [[nodiscard]] auto fits(std::string_view text) const -> bool {
        return indent_width() + text.size() <= LINE_WIDTH;
    }

    [[nodiscard]] auto str() const -> const std::string& {
        return output_;
    }

    [[nodiscard]] auto take() -> std::string {
        return std::move(output_);
    }

private:
    std::string output_;
    int indent_level_ = 0;
};

/// RAII indentation scope.
class IndentScope {
public:
    explicit IndentScope(DartWriter& writer) : writer_(writer) {
        writer_.push_indent();
    }
    ~IndentScope() {
        writer_.pop_indent();
    }
    IndentScope(const IndentScope&) = delete;
    auto operator=(const IndentScope&) -> IndentScope& = delete;

private:
    DartWriter& writer_;
};

/// Joins `items` with `sep`.
[[nodiscard]] auto join(const std::vector<std::string>& items, std::string_view sep) -> std::string;

} // namespace sfg::emit

#endif // SFG_EMIT_DART_WRITER_HPP
