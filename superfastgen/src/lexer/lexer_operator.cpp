//! # Operator Lexing
//!
//! Longest-match operators, except that `>` never combines with a following
//! `>`. Shifts to the right are irrelevant for declarations, while nested
//! generic closers are everywhere.

#include "lexer/lexer.hpp"

namespace sfg::lexer {

auto Lexer::lex_operator() -> Token {
    char c = advance();

    auto follows = [this](char expected) {
        if (peek() == expected) {
            advance();
            return true;
        }
        return false;
    };

    switch (c) {
    case '(':
        return make_token(TokenKind::LParen);
    case ')':
        return make_token(TokenKind::RParen);
    case '{':
        return make_token(TokenKind::LBrace);
    case '}':
        return make_token(TokenKind::RBrace);
    case '[':
        return make_token(TokenKind::LBracket);
    case ']':
        return make_token(TokenKind::RBracket);
    case ',':
        return make_token(TokenKind::Comma);
    case ';':
        return make_token(TokenKind::Semi);
    case ':':
        return make_token(TokenKind::Colon);
    case '@':
        return make_token(TokenKind::At);
    case '#':
        return make_token(TokenKind::Hash);
    case '.':
        if (peek() == '.' && peek_next() == '.') {
            advance();
            advance();
            return make_token(TokenKind::Ellipsis);
        }
        if (follows('.')) {
            return make_token(TokenKind::DotDot);
        }
        return make_token(TokenKind::Dot);
    case '?':
        if (follows('.')) {
            return make_token(TokenKind::QuestionDot);
        }
        if (follows('?')) {
            if (follows('=')) {
                return make_token(TokenKind::CompoundAssign);
            }
            return make_token(TokenKind::QuestionQuestion);
        }
        return make_token(TokenKind::Question);
    case '=':
        if (follows('>')) {
            return make_token(TokenKind::Arrow);
        }
        if (follows('=')) {
            return make_token(TokenKind::EqEq);
        }
        return make_token(TokenKind::Eq);
    case '!':
        if (follows('=')) {
            return make_token(TokenKind::BangEq);
        }
        return make_token(TokenKind::Bang);
    case '<':
        if (follows('<')) {
            if (follows('=')) {
                return make_token(TokenKind::CompoundAssign);
            }
            return make_token(TokenKind::ShiftLeft);
        }
        if (follows('=')) {
            return make_token(TokenKind::Le);
        }
        return make_token(TokenKind::Lt);
    case '>':
        if (follows('=')) {
            return make_token(TokenKind::Ge);
        }
        return make_token(TokenKind::Gt);
    case '+':
        if (follows('+')) {
            return make_token(TokenKind::PlusPlus);
        }
        if (follows('=')) {
            return make_token(TokenKind::CompoundAssign);
        }
        return make_token(TokenKind::Plus);
    case '-':
        if (follows('-')) {
            return make_token(TokenKind::MinusMinus);
        }
        if (follows('=')) {
            return make_token(TokenKind::CompoundAssign);
        }
        return make_token(TokenKind::Minus);
    case '*':
        if (follows('=')) {
            return make_token(TokenKind::CompoundAssign);
        }
        return make_token(TokenKind::Star);
    case '/':
        if (follows('=')) {
            return make_token(TokenKind::CompoundAssign);
        }
        return make_token(TokenKind::Slash);
    case '%':
        if (follows('=')) {
            return make_token(TokenKind::CompoundAssign);
        }
        return make_token(TokenKind::Percent);
    case '~':
        if (follows('/')) {
            if (follows('=')) {
                return make_token(TokenKind::CompoundAssign);
            }
            return make_token(TokenKind::TildeSlash);
        }
        return make_token(TokenKind::Tilde);
    case '&':
        if (follows('&')) {
            if (follows('=')) {
                return make_token(TokenKind::CompoundAssign);
            }
            return make_token(TokenKind::AmpAmp);
        }
        if (follows('=')) {
            return make_token(TokenKind::CompoundAssign);
        }
        return make_token(TokenKind::Amp);
    case '|':
        if (follows('|')) {
            if (follows('=')) {
                return make_token(TokenKind::CompoundAssign);
            }
            return make_token(TokenKind::PipePipe);
        }
        if (follows('=')) {
            return make_token(TokenKind::CompoundAssign);
        }
        return make_token(TokenKind::Pipe);
    case '^':
        if (follows('=')) {
            return make_token(TokenKind::CompoundAssign);
        }
        return make_token(TokenKind::Caret);
    default:
        break;
    }

    // Skip the remaining bytes of a multi-byte UTF-8 sequence so the error
    // covers the whole character.
    while (!is_at_end() && (static_cast<unsigned char>(peek()) & 0xC0) == 0x80) {
        advance();
    }
    return make_error_token("Unexpected character '" +
                            std::string(source_.slice(token_start_, pos_)) + "'");
}

} // namespace sfg::lexer
