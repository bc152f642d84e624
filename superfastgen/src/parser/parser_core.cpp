//! # Parser Core
//!
//! Token navigation, delimiter-balanced skipping and the unit entry point.
//!
//! ## Token Navigation
//!
//! | Method | Description |
//! |--------|-------------|
//! | `peek()` | Current token |
//! | `peek_next()` | Token after the current one |
//! | `advance()` | Consume and return the current token |
//! | `check_word()` | Current token is an identifier with this text |
//! | `expect()` | Require a token kind or fail |
//!
//! ## Skipping
//!
//! Bodies and expressions are never parsed. `skip_balanced()` walks a
//! `()`, `[]` or `{}` group with a delimiter stack; `skip_expression()`
//! stops at a depth-0 terminator and returns the raw text it consumed.

#include "parser/parser.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <cctype>

namespace sfg::parser {

using lexer::Token;
using lexer::TokenKind;

namespace {

auto closer_for(TokenKind kind) -> TokenKind {
    switch (kind) {
    case TokenKind::LParen:
        return TokenKind::RParen;
    case TokenKind::LBracket:
        return TokenKind::RBracket;
    default:
        return TokenKind::RBrace;
    }
}

auto is_opener(TokenKind kind) -> bool {
    return kind == TokenKind::LParen || kind == TokenKind::LBracket || kind == TokenKind::LBrace;
}

auto is_closer(TokenKind kind) -> bool {
    return kind == TokenKind::RParen || kind == TokenKind::RBracket || kind == TokenKind::RBrace;
}

} // anonymous namespace

/// Collapses whitespace runs to one space and trims both ends.
auto collapse_whitespace(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());
    bool pending_space = false;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out += ' ';
            pending_space = false;
        }
        out += c;
    }
    return out;
}

Parser::Parser(const lexer::Source& source, std::vector<Token> tokens)
    : source_(source), tokens_(std::move(tokens)) {
    if (tokens_.empty() || !tokens_.back().is_eof()) {
        auto loc = source_.location(source_.length());
        tokens_.push_back(Token{.kind = TokenKind::Eof, .span = {loc, loc}, .lexeme = {}});
    }
}

// ============================================================================
// Token Access
// ============================================================================

auto Parser::peek() const -> const Token& {
    return peek_at(0);
}

auto Parser::peek_next() const -> const Token& {
    return peek_at(1);
}

auto Parser::peek_at(size_t n) const -> const Token& {
    if (pos_ + n >= tokens_.size()) {
        return tokens_.back();
    }
    return tokens_[pos_ + n];
}

auto Parser::previous() const -> const Token& {
    if (pos_ == 0) {
        return tokens_[0];
    }
    return tokens_[pos_ - 1];
}

auto Parser::advance() -> const Token& {
    if (!is_at_end()) {
        ++pos_;
    }
    return previous();
}

auto Parser::is_at_end() const -> bool {
    return peek().is_eof();
}

auto Parser::check(TokenKind kind) const -> bool {
    return peek().kind == kind;
}

auto Parser::check_word(std::string_view word) const -> bool {
    return peek().is_word(word);
}

auto Parser::match(TokenKind kind) -> bool {
    if (check(kind)) {
        advance();
        return true;
    }
    return false;
}

auto Parser::match_word(std::string_view word) -> bool {
    if (check_word(word)) {
        advance();
        return true;
    }
    return false;
}

auto Parser::error_here(const std::string& message) const -> ParseError {
    return ParseError{.message = message, .span = peek().span, .notes = {}};
}

auto Parser::expect(TokenKind kind, const std::string& message) -> Result<Token, ParseError> {
    if (check(kind)) {
        return advance();
    }
    std::string found = peek().is_eof() ? "end of file" : std::string(peek().lexeme);
    return error_here(message + ", found '" + found + "'");
}

auto Parser::expect_identifier(const std::string& message) -> Result<Token, ParseError> {
    return expect(TokenKind::Identifier, message);
}

auto Parser::hard(ParseError error) -> ParseError {
    if (!hard_error_) {
        hard_error_ = error;
    }
    return error;
}

auto Parser::text_between(size_t first, size_t last) const -> std::string {
    if (first >= tokens_.size() || last >= tokens_.size() || last < first) {
        return {};
    }
    return std::string(
        source_.slice(tokens_[first].span.start.offset, tokens_[last].end_offset()));
}

// ============================================================================
// Skipping
// ============================================================================

auto Parser::skip_balanced() -> Result<bool, ParseError> {
    if (!is_opener(peek().kind)) {
        return error_here("Expected '(', '[' or '{'");
    }

    std::vector<TokenKind> stack;
    while (!is_at_end()) {
        const auto& tok = advance();
        if (is_opener(tok.kind)) {
            stack.push_back(closer_for(tok.kind));
        } else if (is_closer(tok.kind)) {
            if (stack.back() != tok.kind) {
                return hard(ParseError{
                    .message = "Unbalanced delimiters: expected '" +
                               std::string(lexer::token_kind_to_string(stack.back())) +
                               "', found '" + std::string(tok.lexeme) + "'",
                    .span = tok.span,
                    .notes = {}});
            }
            stack.pop_back();
        }
        if (stack.empty()) {
            return true;
        }
    }
    return hard(error_here("Unbalanced delimiters: unexpected end of file"));
}

auto Parser::skip_angles() -> Result<bool, ParseError> {
    if (!match(TokenKind::Lt)) {
        return error_here("Expected '<'");
    }
    int depth = 1;
    while (!is_at_end() && depth > 0) {
        if (check(TokenKind::Lt)) {
            ++depth;
        } else if (check(TokenKind::Gt)) {
            --depth;
        } else if (is_opener(peek().kind)) {
            auto r = skip_balanced();
            if (is_err(r)) {
                return unwrap_err(r);
            }
            continue;
        } else if (is_closer(peek().kind) || check(TokenKind::Semi)) {
            return error_here("Unterminated type argument list");
        }
        advance();
    }
    if (depth > 0) {
        return hard(error_here("Unterminated type argument list"));
    }
    return true;
}

auto Parser::skip_expression(std::initializer_list<TokenKind> terminators)
    -> Result<std::string, ParseError> {
    auto is_terminator = [&](TokenKind kind) {
        return std::find(terminators.begin(), terminators.end(), kind) != terminators.end();
    };

    size_t first = pos_;
    std::vector<TokenKind> stack;
    int angles = 0;

    while (!is_at_end()) {
        const auto& tok = peek();
        if (stack.empty() && angles == 0 && is_terminator(tok.kind)) {
            break;
        }
        if (is_opener(tok.kind)) {
            stack.push_back(closer_for(tok.kind));
        } else if (is_closer(tok.kind)) {
            if (stack.empty() || stack.back() != tok.kind) {
                if (stack.empty() && angles > 0 && is_terminator(tok.kind)) {
                    // A stray '<' was a comparison after all.
                    break;
                }
                return hard(ParseError{.message = "Unbalanced delimiters: unexpected '" +
                                                  std::string(tok.lexeme) + "'",
                                       .span = tok.span,
                                       .notes = {}});
            }
            stack.pop_back();
        } else if (stack.empty() && tok.is(TokenKind::Lt)) {
            const auto& prev = pos_ > 0 ? tokens_[pos_ - 1] : tok;
            bool generic = pos_ == first || prev.is(TokenKind::KwConst) ||
                           prev.is(TokenKind::KwNew) ||
                           (prev.is(TokenKind::Identifier) &&
                            prev.end_offset() == tok.span.start.offset);
            if (generic) {
                ++angles;
            }
        } else if (stack.empty() && angles > 0 && tok.is(TokenKind::Gt)) {
            --angles;
        }
        advance();
    }

    if (is_at_end() && !is_terminator(TokenKind::Eof)) {
        return hard(error_here("Unexpected end of file in expression"));
    }
    if (pos_ == first) {
        return std::string{};
    }
    return collapse_whitespace(text_between(first, pos_ - 1));
}

auto Parser::skip_function_body() -> Result<bool, ParseError> {
    if (check(TokenKind::LBrace)) {
        auto r = skip_balanced();
        if (is_err(r)) {
            return unwrap_err(r);
        }
        return true;
    }
    if (match(TokenKind::Arrow)) {
        auto expr = skip_expression({TokenKind::Semi});
        if (is_err(expr)) {
            return unwrap_err(expr);
        }
        auto semi = expect(TokenKind::Semi, "Expected ';' after expression body");
        if (is_err(semi)) {
            return unwrap_err(semi);
        }
        return true;
    }
    if (match(TokenKind::Semi)) {
        return false;
    }
    return error_here("Expected a function body");
}

auto Parser::skip_declaration() -> Result<std::string, ParseError> {
    size_t first = pos_;

    while (!is_at_end()) {
        if (match(TokenKind::Semi)) {
            break;
        }
        if (check(TokenKind::RBrace)) {
            break;
        }
        if (check(TokenKind::LBrace)) {
            auto r = skip_balanced();
            if (is_err(r)) {
                return unwrap_err(r);
            }
            break;
        }
        if (check(TokenKind::Eq)) {
            advance();
            auto expr = skip_expression({TokenKind::Semi, TokenKind::Comma});
            if (is_err(expr)) {
                return unwrap_err(expr);
            }
            continue;
        }
        if (check(TokenKind::Arrow)) {
            advance();
            auto expr = skip_expression({TokenKind::Semi});
            if (is_err(expr)) {
                return unwrap_err(expr);
            }
            match(TokenKind::Semi);
            break;
        }
        if (is_opener(peek().kind)) {
            auto r = skip_balanced();
            if (is_err(r)) {
                return unwrap_err(r);
            }
            continue;
        }
        if (is_closer(peek().kind)) {
            return hard(error_here("Unbalanced delimiters: unexpected '" +
                                   std::string(peek().lexeme) + "'"));
        }
        advance();
    }

    if (pos_ == first) {
        return std::string{};
    }
    auto text = collapse_whitespace(text_between(first, pos_ - 1));
    if (text.size() > 60) {
        text = text.substr(0, 57) + "...";
    }
    return text;
}

auto Parser::parse_async_marker() -> std::string {
    if (check_word("async")) {
        advance();
        if (match(TokenKind::Star)) {
            return "async*";
        }
        return "async";
    }
    if (check_word("sync") && peek_next().is(TokenKind::Star)) {
        advance();
        advance();
        return "sync*";
    }
    return {};
}

// ============================================================================
// Entry Points
// ============================================================================

auto Parser::parse_type_only() -> Result<TypeNode, ParseError> {
    auto r = parse_type();
    if (is_ok(r) && !is_at_end()) {
        return error_here("Unexpected tokens after type");
    }
    return r;
}

auto Parser::parse_unit() -> Result<CompilationUnit, std::vector<ParseError>> {
    CompilationUnit unit;

    while (!is_at_end()) {
        size_t start = pos_;

        if (match(TokenKind::Semi)) {
            continue;
        }

        auto annotations = parse_annotations();
        if (is_err(annotations)) {
            return std::vector<ParseError>{unwrap_err(annotations)};
        }

        Result<bool, ParseError> step = true;
        if (at_directive()) {
            auto directive = parse_directive();
            if (is_err(directive)) {
                return std::vector<ParseError>{unwrap_err(directive)};
            }
            unit.directives.push_back(std::move(unwrap(directive)));
        } else if (at_class_header()) {
            auto cls = parse_class(std::move(unwrap(annotations)), start);
            if (is_err(cls)) {
                return std::vector<ParseError>{unwrap_err(cls)};
            }
            if (unwrap(cls)) {
                unit.decls.push_back(TopLevelDecl{std::move(*unwrap(cls))});
            } else {
                unit.skipped.push_back(collapse_whitespace(text_between(start, pos_ - 1)));
            }
        } else if (check(TokenKind::KwEnum)) {
            auto en = parse_enum(std::move(unwrap(annotations)));
            if (is_err(en)) {
                return std::vector<ParseError>{unwrap_err(en)};
            }
            unit.decls.push_back(TopLevelDecl{std::move(unwrap(en))});
        } else {
            step = parse_top_level(std::move(unwrap(annotations)), start, unit);
        }

        if (is_err(step)) {
            return std::vector<ParseError>{unwrap_err(step)};
        }
        if (hard_error_) {
            return std::vector<ParseError>{*hard_error_};
        }
    }

    SFG_LOG_TRACE("parser", "Parsed " << source_.filename() << ": " << unit.decls.size()
                                      << " declarations, " << unit.directives.size()
                                      << " directives");
    return unit;
}

auto parse_source(const lexer::Source& source) -> Result<CompilationUnit, std::vector<ParseError>> {
    lexer::Lexer lexer(source);
    auto tokens = lexer.tokenize();

    if (lexer.has_errors()) {
        std::vector<ParseError> errors;
        for (const auto& e : lexer.errors()) {
            errors.push_back(ParseError{.message = e.message, .span = e.span, .notes = {}});
        }
        return errors;
    }

    Parser parser(source, std::move(tokens));
    return parser.parse_unit();
}

} // namespace sfg::parser
