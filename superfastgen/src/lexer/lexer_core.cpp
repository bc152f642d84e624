//! # Lexer Core
//!
//! Keyword table, character access, trivia skipping and the main dispatch.
//!
//! | Category | Handled by |
//! |----------|------------|
//! | Identifiers, keywords | `lex_identifier()` |
//! | Numbers | `lex_number()` |
//! | Strings, raw strings | `lex_string()` |
//! | Operators, delimiters | `lex_operator()` |

#include "lexer/lexer.hpp"

#include <unordered_map>

namespace sfg::lexer {

namespace {

// Dart reserved words. Built-in identifiers (abstract, factory, get, ...) are
// deliberately absent: they are valid identifiers in most positions.
const std::unordered_map<std::string_view, TokenKind> KEYWORDS = {
    {"assert", TokenKind::KwAssert},     {"break", TokenKind::KwBreak},
    {"case", TokenKind::KwCase},         {"catch", TokenKind::KwCatch},
    {"class", TokenKind::KwClass},       {"const", TokenKind::KwConst},
    {"continue", TokenKind::KwContinue}, {"default", TokenKind::KwDefault},
    {"do", TokenKind::KwDo},             {"else", TokenKind::KwElse},
    {"enum", TokenKind::KwEnum},         {"extends", TokenKind::KwExtends},
    {"false", TokenKind::KwFalse},       {"final", TokenKind::KwFinal},
    {"finally", TokenKind::KwFinally},   {"for", TokenKind::KwFor},
    {"if", TokenKind::KwIf},             {"in", TokenKind::KwIn},
    {"is", TokenKind::KwIs},             {"new", TokenKind::KwNew},
    {"null", TokenKind::KwNull},         {"rethrow", TokenKind::KwRethrow},
    {"return", TokenKind::KwReturn},     {"super", TokenKind::KwSuper},
    {"switch", TokenKind::KwSwitch},     {"this", TokenKind::KwThis},
    {"throw", TokenKind::KwThrow},       {"true", TokenKind::KwTrue},
    {"try", TokenKind::KwTry},           {"var", TokenKind::KwVar},
    {"void", TokenKind::KwVoid},         {"while", TokenKind::KwWhile},
    {"with", TokenKind::KwWith},
};

} // anonymous namespace

Lexer::Lexer(const Source& source) : source_(source) {}

auto Lexer::peek() const -> char {
    return source_.at(pos_);
}

auto Lexer::peek_next() const -> char {
    return source_.at(pos_ + 1);
}

auto Lexer::peek_n(size_t n) const -> char {
    return source_.at(pos_ + n);
}

auto Lexer::advance() -> char {
    char c = peek();
    ++pos_;
    return c;
}

auto Lexer::is_at_end() const -> bool {
    return pos_ >= source_.length();
}

auto Lexer::is_ident_start(char c) -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c == '$';
}

auto Lexer::is_ident_char(char c) -> bool {
    return is_ident_start(c) || (c >= '0' && c <= '9');
}

auto Lexer::make_token(TokenKind kind) -> Token {
    auto start_loc = source_.location(token_start_);
    auto end_loc = source_.location(pos_ > 0 ? pos_ - 1 : 0);
    start_loc.length = static_cast<uint32_t>(pos_ - token_start_);
    end_loc.length = start_loc.length;

    return Token{.kind = kind,
                 .span = {start_loc, end_loc},
                 .lexeme = source_.slice(token_start_, pos_),
                 .interpolated = false};
}

auto Lexer::make_error_token(const std::string& message) -> Token {
    report_error(message, token_start_);
    auto token = make_token(TokenKind::Error);
    return token;
}

void Lexer::report_error(const std::string& message, size_t at) {
    errors_.push_back(LexerError{.message = message,
                                 .span = {source_.location(at), source_.location(pos_)}});
}

auto Lexer::skip_trivia() -> bool {
    while (!is_at_end()) {
        char c = peek();
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v') {
            advance();
        } else if (c == '/' && peek_next() == '/') {
            while (!is_at_end() && peek() != '\n') {
                advance();
            }
        } else if (c == '/' && peek_next() == '*') {
            if (!skip_block_comment()) {
                return false;
            }
        } else {
            break;
        }
    }
    return true;
}

auto Lexer::skip_block_comment() -> bool {
    size_t start = pos_;
    advance(); // '/'
    advance(); // '*'
    int depth = 1;

    while (!is_at_end() && depth > 0) {
        if (peek() == '/' && peek_next() == '*') {
            advance();
            advance();
            ++depth;
        } else if (peek() == '*' && peek_next() == '/') {
            advance();
            advance();
            --depth;
        } else {
            advance();
        }
    }

    if (depth > 0) {
        report_error("Unterminated block comment", start);
        return false;
    }
    return true;
}

auto Lexer::next_token() -> Token {
    if (!skip_trivia()) {
        token_start_ = pos_;
        return make_token(TokenKind::Error);
    }

    token_start_ = pos_;
    if (is_at_end()) {
        return make_token(TokenKind::Eof);
    }

    char c = peek();
    if (c == 'r' && (peek_next() == '\'' || peek_next() == '"')) {
        advance();
        return lex_string(true);
    }
    if (is_ident_start(c)) {
        return lex_identifier();
    }
    if (c >= '0' && c <= '9') {
        return lex_number();
    }
    if (c == '.' && peek_next() >= '0' && peek_next() <= '9') {
        return lex_number();
    }
    if (c == '\'' || c == '"') {
        return lex_string(false);
    }
    return lex_operator();
}

auto Lexer::tokenize() -> std::vector<Token> {
    std::vector<Token> tokens;
    tokens.reserve(source_.length() / 4);

    while (true) {
        auto token = next_token();
        bool eof = token.is_eof();
        bool fatal = token.is(TokenKind::Error) && is_at_end();
        tokens.push_back(token);
        if (eof) {
            break;
        }
        if (fatal) {
            token_start_ = pos_;
            tokens.push_back(make_token(TokenKind::Eof));
            break;
        }
    }

    return tokens;
}

auto Lexer::lex_identifier() -> Token {
    while (is_ident_char(peek())) {
        advance();
    }

    auto text = source_.slice(token_start_, pos_);
    auto it = KEYWORDS.find(text);
    if (it != KEYWORDS.end()) {
        return make_token(it->second);
    }
    return make_token(TokenKind::Identifier);
}

auto Lexer::lex_number() -> Token {
    auto is_digit = [](char c) { return c >= '0' && c <= '9'; };
    auto is_hex = [&](char c) {
        return is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
    };

    if (peek() == '0' && (peek_next() == 'x' || peek_next() == 'X')) {
        advance();
        advance();
        if (!is_hex(peek())) {
            return make_error_token("Hexadecimal literal has no digits");
        }
        while (is_hex(peek()) || peek() == '_') {
            advance();
        }
        return make_token(TokenKind::IntLiteral);
    }

    bool is_double = false;
    while (is_digit(peek()) || peek() == '_') {
        advance();
    }
    if (peek() == '.' && is_digit(peek_next())) {
        is_double = true;
        advance();
        while (is_digit(peek()) || peek() == '_') {
            advance();
        }
    }
    if (peek() == 'e' || peek() == 'E') {
        size_t sign = (peek_next() == '+' || peek_next() == '-') ? 1 : 0;
        if (is_digit(peek_n(1 + sign))) {
            is_double = true;
            advance();
            if (sign) {
                advance();
            }
            while (is_digit(peek())) {
                advance();
            }
        }
    }

    return make_token(is_double ? TokenKind::DoubleLiteral : TokenKind::IntLiteral);
}

} // namespace sfg::lexer
