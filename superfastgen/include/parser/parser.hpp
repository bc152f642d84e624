//! # Dart Declaration Parser
//!
//! Recursive-descent parser that turns a token stream into a
//! `CompilationUnit`. It understands declarations and parameter lists in
//! full and steps over everything else by balanced-delimiter scanning.
//!
//! ## Failure Model
//!
//! Any lexer error, unbalanced delimiter, unexpected top-level token or
//! type nested deeper than `MAX_TYPE_DEPTH` fails the whole file with a
//! `ParseError`. Class members the parser cannot make sense of are skipped
//! and listed in `ClassNode::skipped_members` instead.

#ifndef SFG_PARSER_PARSER_HPP
#define SFG_PARSER_PARSER_HPP

#include "common.hpp"
#include "lexer/lexer.hpp"
#include "parser/syntax.hpp"

#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

namespace sfg::parser {

constexpr int MAX_TYPE_DEPTH = 32;

struct ParseError {
    std::string message;
    SourceSpan span;
    std::vector<std::string> notes;
};

class Parser {
public:
    Parser(const lexer::Source& source, std::vector<lexer::Token> tokens);

    /// Parses the whole unit. On failure the vector holds at least one error.
    [[nodiscard]] auto parse_unit() -> Result<CompilationUnit, std::vector<ParseError>>;

    /// Parses a single type annotation (for tests).
    [[nodiscard]] auto parse_type_only() -> Result<TypeNode, ParseError>;

private:
    const lexer::Source& source_;
    std::vector<lexer::Token> tokens_;
    size_t pos_ = 0;
    std::optional<ParseError> hard_error_;

    // ========================================================================
    // Token Access
    // ========================================================================

    [[nodiscard]] auto peek() const -> const lexer::Token&;
    [[nodiscard]] auto peek_next() const -> const lexer::Token&;
    [[nodiscard]] auto peek_at(size_t n) const -> const lexer::Token&;
    [[nodiscard]] auto previous() const -> const lexer::Token&;
    auto advance() -> const lexer::Token&;
    [[nodiscard]] auto is_at_end() const -> bool;
    [[nodiscard]] auto check(lexer::TokenKind kind) const -> bool;
    [[nodiscard]] auto check_word(std::string_view word) const -> bool;
    auto match(lexer::TokenKind kind) -> bool;
    auto match_word(std::string_view word) -> bool;
    auto expect(lexer::TokenKind kind, const std::string& message)
        -> Result<lexer::Token, ParseError>;
    auto expect_identifier(const std::string& message) -> Result<lexer::Token, ParseError>;

    [[nodiscard]] auto error_here(const std::string& message) const -> ParseError;

    /// Source text between two token indices, inclusive.
    [[nodiscard]] auto text_between(size_t first, size_t last) const -> std::string;

    // ========================================================================
    // Skipping
    // ========================================================================

    /// Consumes an opener at the current position through its matching closer.
    auto skip_balanced() -> Result<bool, ParseError>;

    /// Consumes an expression up to (not including) a depth-0 terminator and
    /// returns its trimmed source text.
    auto skip_expression(std::initializer_list<lexer::TokenKind> terminators)
        -> Result<std::string, ParseError>;

    /// Consumes `<` through its matching `>`.
    auto skip_angles() -> Result<bool, ParseError>;

    /// Records `error` as fatal for the file and returns it.
    auto hard(ParseError error) -> ParseError;

    /// Consumes a function body: block, `=> expr;` or a bare `;`.
    /// Returns true when a body (block or arrow) was present.
    auto skip_function_body() -> Result<bool, ParseError>;

    /// Consumes an unrecognized member or top-level construct.
    auto skip_declaration() -> Result<std::string, ParseError>;

    // ========================================================================
    // Declarations
    // ========================================================================

    auto parse_annotations() -> Result<std::vector<Annotation>, ParseError>;
    auto parse_annotation() -> Result<Annotation, ParseError>;
    auto parse_directive() -> Result<DirectiveNode, ParseError>;
    [[nodiscard]] auto at_directive() const -> bool;
    [[nodiscard]] auto at_class_header() const -> bool;

    auto parse_class(std::vector<Annotation> annotations, size_t start)
        -> Result<std::optional<ClassNode>, ParseError>;
    auto parse_member(ClassNode& cls) -> Result<bool, ParseError>;
    auto parse_constructor(std::vector<Annotation> annotations, bool is_const, bool is_factory,
                           bool is_external, const std::string& class_name)
        -> Result<ConstructorNode, ParseError>;
    auto parse_enum(std::vector<Annotation> annotations) -> Result<EnumNode, ParseError>;
    auto parse_top_level(std::vector<Annotation> annotations, size_t start,
                         CompilationUnit& unit) -> Result<bool, ParseError>;

    // ========================================================================
    // Types and Parameters
    // ========================================================================

    auto parse_type(int depth = 0) -> Result<TypeNode, ParseError>;
    auto parse_function_type_suffix(TypeNode return_type, size_t start, int depth)
        -> Result<TypeNode, ParseError>;

    /// Tries to read a type that is followed by a name. Restores the position
    /// and returns nullopt when the tokens are not `Type name`.
    auto try_type_before_name() -> std::optional<TypeNode>;

    auto parse_type_params() -> Result<std::vector<TypeParamNode>, ParseError>;
    auto parse_params() -> Result<std::vector<ParamNode>, ParseError>;
    auto parse_param(ParamKind kind) -> Result<ParamNode, ParseError>;
    auto parse_async_marker() -> std::string;
};

/// Collapses whitespace runs to one space and trims both ends.
[[nodiscard]] auto collapse_whitespace(std::string_view text) -> std::string;

/// Lexes and parses `source`, mapping lexer errors to parse errors.
[[nodiscard]] auto parse_source(const lexer::Source& source)
    -> Result<CompilationUnit, std::vector<ParseError>>;

} // namespace sfg::parser

#endif // SFG_PARSER_PARSER_HPP
