//! # Dart Lexer
//!
//! Converts Dart source text into tokens for the declaration parser.
//!
//! ## Features
//!
//! - Identifiers with `$` and `_`
//! - Decimal, hexadecimal and exponent number forms
//! - Single, double and triple quoted strings, raw strings, and `${...}`
//!   interpolation with arbitrary nesting. A whole string is one token.
//! - Line, doc and nested block comments are skipped
//!
//! ## Error Recovery
//!
//! The lexer records an error and returns a `TokenKind::Error` token, then
//! keeps going. The parser treats any lexer error as fatal for the file.
//!
//! ```cpp
//! auto source = Source::from_string("class A {}");
//! Lexer lexer(source);
//! auto tokens = lexer.tokenize();
//! ```

#ifndef SFG_LEXER_LEXER_HPP
#define SFG_LEXER_LEXER_HPP

#include "common.hpp"
#include "lexer/source.hpp"
#include "lexer/token.hpp"

#include <string>
#include <vector>

namespace sfg::lexer {

struct LexerError {
    std::string message;
    SourceSpan span;
};

class Lexer {
public:
    explicit Lexer(const Source& source);

    /// Next token; `Eof` forever once input is exhausted.
    [[nodiscard]] auto next_token() -> Token;

    /// All tokens up to and including `Eof`.
    [[nodiscard]] auto tokenize() -> std::vector<Token>;

    [[nodiscard]] auto errors() const -> const std::vector<LexerError>& {
        return errors_;
    }

    [[nodiscard]] auto has_errors() const -> bool {
        return !errors_.empty();
    }

private:
    const Source& source_;
    size_t pos_ = 0;
    size_t token_start_ = 0;
    std::vector<LexerError> errors_;

    // ========================================================================
    // Character Access
    // ========================================================================

    [[nodiscard]] auto peek() const -> char;
    [[nodiscard]] auto peek_next() const -> char;
    [[nodiscard]] auto peek_n(size_t n) const -> char;
    auto advance() -> char;
    [[nodiscard]] auto is_at_end() const -> bool;

    // ========================================================================
    // Token Creation
    // ========================================================================

    [[nodiscard]] auto make_token(TokenKind kind) -> Token;
    [[nodiscard]] auto make_error_token(const std::string& message) -> Token;
    void report_error(const std::string& message, size_t at);

    // ========================================================================
    // Whitespace and Comments
    // ========================================================================

    /// Skips whitespace and comments. Returns false on an unterminated block comment.
    auto skip_trivia() -> bool;

    auto skip_block_comment() -> bool;

    // ========================================================================
    // Token Lexers
    // ========================================================================

    [[nodiscard]] auto lex_identifier() -> Token;
    [[nodiscard]] auto lex_number() -> Token;
    [[nodiscard]] auto lex_string(bool raw) -> Token;
    [[nodiscard]] auto lex_operator() -> Token;

    /// Scans a string starting at the opening quote. Sets `interpolated` when
    /// the body contains `$` interpolation. Returns false if unterminated.
    auto scan_string(bool raw, bool& interpolated) -> bool;

    /// Scans the code inside `${` up to its matching `}`.
    auto scan_interpolation() -> bool;

    [[nodiscard]] static auto is_ident_start(char c) -> bool;
    [[nodiscard]] static auto is_ident_char(char c) -> bool;
};

} // namespace sfg::lexer

#endif // SFG_LEXER_LEXER_HPP
