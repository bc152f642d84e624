//! # Token Definitions
//!
//! Token kinds produced by the Dart lexer.
//!
//! ## Overview
//!
//! - **Literals**: integers, doubles, strings (interpolation included)
//! - **Keywords**: Dart reserved words. Built-in identifiers such as
//!   `factory`, `required`, `get` or `async` stay `Identifier` tokens and are
//!   recognized by lexeme where the grammar gives them meaning.
//! - **Operators and delimiters**
//!
//! ## Generic Closers
//!
//! `>` is always a single token, so `Map<String, List<int>>` closes with two
//! `Gt` tokens and never a shift operator.

#ifndef SFG_LEXER_TOKEN_HPP
#define SFG_LEXER_TOKEN_HPP

#include "common.hpp"

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

namespace sfg::lexer {

enum class TokenKind : uint8_t {
    Eof,
    Error,

    // ========================================================================
    // Literals
    // ========================================================================
    IntLiteral,    ///< `42`, `0xFF`
    DoubleLiteral, ///< `3.14`, `1e10`
    StringLiteral, ///< any quoted string, adjacent pieces are separate tokens
    Identifier,    ///< `foo`, `_bar`, `$baz`, and built-in identifiers

    // ========================================================================
    // Reserved Words
    // ========================================================================
    KwAssert,
    KwBreak,
    KwCase,
    KwCatch,
    KwClass,
    KwConst,
    KwContinue,
    KwDefault,
    KwDo,
    KwElse,
    KwEnum,
    KwExtends,
    KwFalse,
    KwFinal,
    KwFinally,
    KwFor,
    KwIf,
    KwIn,
    KwIs,
    KwNew,
    KwNull,
    KwRethrow,
    KwReturn,
    KwSuper,
    KwSwitch,
    KwThis,
    KwThrow,
    KwTrue,
    KwTry,
    KwVar,
    KwVoid,
    KwWhile,
    KwWith,

    // ========================================================================
    // Delimiters
    // ========================================================================
    LParen,
    RParen,
    LBrace,
    RBrace,
    LBracket,
    RBracket,
    Comma,
    Semi,
    Colon,
    Dot,
    DotDot,      ///< `..` cascade
    Ellipsis,    ///< `...` spread
    At,          ///< `@` annotation
    Hash,        ///< `#` symbol literal
    Question,    ///< `?` nullable suffix or conditional
    QuestionDot, ///< `?.`
    Arrow,       ///< `=>`

    // ========================================================================
    // Operators
    // ========================================================================
    Eq,
    EqEq,
    Bang,
    BangEq,
    Lt,
    Le,
    Gt,
    Ge,
    Plus,
    Minus,
    Star,
    Slash,
    TildeSlash,
    Percent,
    Amp,
    AmpAmp,
    Pipe,
    PipePipe,
    Caret,
    Tilde,
    PlusPlus,
    MinusMinus,
    QuestionQuestion,
    CompoundAssign, ///< `+=`, `??=`, `<<=` and the other compound assignments
    ShiftLeft,      ///< `<<`
};

/// A lexed token. `lexeme` views the owning `Source`.
struct Token {
    TokenKind kind;
    SourceSpan span;
    std::string_view lexeme;

    /// True for a string literal containing `$name` or `${...}`.
    bool interpolated = false;

    [[nodiscard]] auto is(TokenKind k) const -> bool {
        return kind == k;
    }

    [[nodiscard]] auto is_one_of(std::initializer_list<TokenKind> kinds) const -> bool {
        for (auto k : kinds) {
            if (kind == k)
                return true;
        }
        return false;
    }

    [[nodiscard]] auto is_eof() const -> bool {
        return kind == TokenKind::Eof;
    }

    /// An identifier with exactly this text (for built-in identifiers).
    [[nodiscard]] auto is_word(std::string_view word) const -> bool {
        return kind == TokenKind::Identifier && lexeme == word;
    }

    /// Offset one past the last byte of this token.
    [[nodiscard]] auto end_offset() const -> size_t {
        return span.start.offset + lexeme.size();
    }

    /// Decoded contents of a non-interpolated string literal.
    ///
    /// Handles single, double and triple quotes, raw strings and the common
    /// escapes. Returns nullopt for other tokens and interpolated strings.
    [[nodiscard]] auto string_value() const -> std::optional<std::string>;
};

[[nodiscard]] auto token_kind_to_string(TokenKind kind) -> std::string_view;

} // namespace sfg::lexer

#endif // SFG_LEXER_TOKEN_HPP
