//! # String Lexing
//!
//! Dart strings come in six shapes: `'...'`, `"..."`, `'''...'''`,
//! `"""..."""` and the raw `r` prefixed forms of each. Interpolation with
//! `${expr}` may contain further strings, so scanning recurses.

#include "lexer/lexer.hpp"

namespace sfg::lexer {

auto Lexer::lex_string(bool raw) -> Token {
    bool interpolated = false;
    if (!scan_string(raw, interpolated)) {
        return make_error_token("Unterminated string literal");
    }
    auto token = make_token(TokenKind::StringLiteral);
    token.interpolated = interpolated;
    return token;
}

auto Lexer::scan_string(bool raw, bool& interpolated) -> bool {
    char quote = advance();
    bool triple = false;
    if (peek() == quote && peek_next() == quote) {
        advance();
        advance();
        triple = true;
    }

    while (!is_at_end()) {
        char c = peek();

        if (!triple && (c == '\n' || c == '\r')) {
            return false;
        }
        if (!raw && c == '\\') {
            advance();
            if (!is_at_end()) {
                advance();
            }
            continue;
        }
        if (c == quote) {
            if (!triple) {
                advance();
                return true;
            }
            if (peek_next() == quote && peek_n(2) == quote) {
                advance();
                advance();
                advance();
                return true;
            }
            advance();
            continue;
        }
        if (!raw && c == '$') {
            interpolated = true;
            advance();
            if (peek() == '{') {
                advance();
                if (!scan_interpolation()) {
                    return false;
                }
            }
            continue;
        }
        advance();
    }

    return false;
}

auto Lexer::scan_interpolation() -> bool {
    int depth = 1;
    while (!is_at_end()) {
        char c = peek();
        if (c == '\'' || c == '"') {
            bool nested = false;
            if (!scan_string(false, nested)) {
                return false;
            }
            continue;
        }
        if (c == 'r' && (peek_next() == '\'' || peek_next() == '"') &&
            (pos_ == 0 || !is_ident_char(source_.at(pos_ - 1)))) {
            advance();
            bool nested = false;
            if (!scan_string(true, nested)) {
                return false;
            }
            continue;
        }
        if (c == '{') {
            ++depth;
        } else if (c == '}') {
            if (--depth == 0) {
                advance();
                return true;
            }
        }
        advance();
    }
    return false;
}

} // namespace sfg::lexer
