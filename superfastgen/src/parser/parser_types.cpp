//! # Type, Parameter and Annotation Parsing
//!
//! | Construct | Example |
//! |-----------|---------|
//! | Named type | `Map<String, List<int>>?` |
//! | Function type | `void Function(int)?` |
//! | Record type | `(int, {String name})` |
//! | Parameter list | `(int a, [int b = 0])`, `({required this.id, @Default(1) int n})` |
//! | Annotation | `@JsonKey(name: 'user_id', includeIfNull: false)` |

#include "parser/parser.hpp"

#include <cctype>

namespace sfg::parser {

using lexer::TokenKind;

// ============================================================================
// Types
// ============================================================================

namespace {

auto canonical_text(const TypeNode& node) -> std::string {
    std::string text = node.name;
    if (!node.args.empty()) {
        text += "<";
        for (size_t i = 0; i < node.args.size(); ++i) {
            if (i > 0) {
                text += ", ";
            }
            text += node.args[i].text;
        }
        text += ">";
    }
    if (node.nullable) {
        text += "?";
    }
    return text;
}

} // anonymous namespace

auto Parser::parse_type(int depth) -> Result<TypeNode, ParseError> {
    if (depth > MAX_TYPE_DEPTH) {
        return hard(error_here("Type nesting exceeds " + std::to_string(MAX_TYPE_DEPTH) +
                               " levels"));
    }

    size_t start = pos_;
    TypeNode node;
    node.span.start = peek().span.start;

    if (check(TokenKind::LParen)) {
        auto r = skip_balanced();
        if (is_err(r)) {
            return unwrap_err(r);
        }
        node.kind = TypeNode::Kind::Record;
        node.nullable = match(TokenKind::Question);
        node.text = collapse_whitespace(text_between(start, pos_ - 1));
    } else if (check_word("Function")) {
        return parse_function_type_suffix(TypeNode{}, start, depth);
    } else if (match(TokenKind::KwVoid)) {
        node.name = "void";
        node.text = "void";
    } else if (check(TokenKind::Identifier)) {
        node.name = std::string(advance().lexeme);
        while (check(TokenKind::Dot) && peek_next().is(TokenKind::Identifier)) {
            advance();
            node.name += ".";
            node.name += advance().lexeme;
        }
        if (match(TokenKind::Lt)) {
            while (true) {
                auto arg = parse_type(depth + 1);
                if (is_err(arg)) {
                    return unwrap_err(arg);
                }
                node.args.push_back(std::move(unwrap(arg)));
                if (match(TokenKind::Comma)) {
                    continue;
                }
                auto close = expect(TokenKind::Gt, "Expected '>' to close type arguments");
                if (is_err(close)) {
                    return unwrap_err(close);
                }
                break;
            }
        }
        node.nullable = match(TokenKind::Question);
        node.text = canonical_text(node);
    } else {
        return error_here("Expected a type");
    }

    node.span.end = previous().span.end;

    while (check_word("Function")) {
        auto fn = parse_function_type_suffix(std::move(node), start, depth);
        if (is_err(fn)) {
            return fn;
        }
        node = std::move(unwrap(fn));
    }
    return node;
}

auto Parser::parse_function_type_suffix(TypeNode return_type, size_t start, int depth)
    -> Result<TypeNode, ParseError> {
    if (depth + 1 > MAX_TYPE_DEPTH) {
        return hard(error_here("Type nesting exceeds " + std::to_string(MAX_TYPE_DEPTH) +
                               " levels"));
    }

    advance(); // Function
    if (check(TokenKind::Lt)) {
        auto r = skip_angles();
        if (is_err(r)) {
            return unwrap_err(r);
        }
    }
    if (!check(TokenKind::LParen)) {
        return error_here("Expected '(' after 'Function'");
    }
    auto r = skip_balanced();
    if (is_err(r)) {
        return unwrap_err(r);
    }

    TypeNode node;
    node.kind = TypeNode::Kind::Function;
    if (!return_type.text.empty()) {
        node.args.push_back(std::move(return_type));
    }
    node.nullable = match(TokenKind::Question);
    node.text = collapse_whitespace(text_between(start, pos_ - 1));
    node.span = {tokens_[start].span.start, previous().span.end};
    return node;
}

auto Parser::try_type_before_name() -> std::optional<TypeNode> {
    if (!check(TokenKind::Identifier) && !check(TokenKind::KwVoid) &&
        !check(TokenKind::LParen)) {
        return std::nullopt;
    }

    size_t saved = pos_;
    auto r = parse_type();
    if (is_ok(r) && (check(TokenKind::Identifier) || check(TokenKind::KwThis) ||
                     check(TokenKind::KwSuper))) {
        return std::move(unwrap(r));
    }
    pos_ = saved;
    return std::nullopt;
}

auto Parser::parse_type_params() -> Result<std::vector<TypeParamNode>, ParseError> {
    std::vector<TypeParamNode> params;
    if (!match(TokenKind::Lt)) {
        return params;
    }

    while (true) {
        auto annotations = parse_annotations();
        if (is_err(annotations)) {
            return unwrap_err(annotations);
        }
        auto name = expect_identifier("Expected type parameter name");
        if (is_err(name)) {
            return unwrap_err(name);
        }
        TypeParamNode param{.name = std::string(unwrap(name).lexeme), .bound = std::nullopt};
        if (match(TokenKind::KwExtends)) {
            auto bound = parse_type(1);
            if (is_err(bound)) {
                return unwrap_err(bound);
            }
            param.bound = std::move(unwrap(bound));
        }
        params.push_back(std::move(param));
        if (match(TokenKind::Comma)) {
            continue;
        }
        auto close = expect(TokenKind::Gt, "Expected '>' to close type parameters");
        if (is_err(close)) {
            return unwrap_err(close);
        }
        break;
    }
    return params;
}

// ============================================================================
// Parameters
// ============================================================================

auto Parser::parse_params() -> Result<std::vector<ParamNode>, ParseError> {
    auto open = expect(TokenKind::LParen, "Expected '(' to start parameter list");
    if (is_err(open)) {
        return unwrap_err(open);
    }

    std::vector<ParamNode> params;
    ParamKind kind = ParamKind::Positional;

    while (!check(TokenKind::RParen)) {
        if (is_at_end()) {
            return hard(error_here("Unterminated parameter list"));
        }
        if (match(TokenKind::LBracket)) {
            kind = ParamKind::OptionalPositional;
            continue;
        }
        if (match(TokenKind::LBrace)) {
            kind = ParamKind::Named;
            continue;
        }
        if (match(TokenKind::RBracket) || match(TokenKind::RBrace)) {
            continue;
        }

        auto param = parse_param(kind);
        if (is_err(param)) {
            return unwrap_err(param);
        }
        params.push_back(std::move(unwrap(param)));

        if (!match(TokenKind::Comma) && !check(TokenKind::RParen) &&
            !check(TokenKind::RBracket) && !check(TokenKind::RBrace)) {
            return error_here("Expected ',' or ')' in parameter list, found '" +
                              std::string(peek().lexeme) + "'");
        }
    }
    advance(); // ')'
    return params;
}

auto Parser::parse_param(ParamKind kind) -> Result<ParamNode, ParseError> {
    ParamNode param;
    param.kind = kind;
    param.span.start = peek().span.start;

    auto annotations = parse_annotations();
    if (is_err(annotations)) {
        return unwrap_err(annotations);
    }
    param.annotations = std::move(unwrap(annotations));

    auto names_param = [this]() {
        const auto& next = peek_next();
        return next.is_one_of({TokenKind::Comma, TokenKind::RParen, TokenKind::RBrace,
                               TokenKind::RBracket, TokenKind::Eq, TokenKind::Colon});
    };

    // Modifiers. A modifier word followed by a terminator is the parameter name.
    while (true) {
        if (check_word("required") && !names_param()) {
            advance();
            param.required = true;
        } else if (check_word("covariant") && !names_param()) {
            advance();
            param.covariant = true;
        } else if (check_word("late") && !names_param()) {
            advance();
        } else if (match(TokenKind::KwFinal) || match(TokenKind::KwConst) ||
                   match(TokenKind::KwVar)) {
        } else {
            break;
        }
    }

    size_t type_start = pos_;

    auto field_name = [this, &param](ParamForm form) -> Result<bool, ParseError> {
        advance(); // this / super
        auto dot = expect(TokenKind::Dot, "Expected '.' in field parameter");
        if (is_err(dot)) {
            return unwrap_err(dot);
        }
        auto name = expect_identifier("Expected field name");
        if (is_err(name)) {
            return unwrap_err(name);
        }
        param.form = form;
        param.name = std::string(unwrap(name).lexeme);
        if (check(TokenKind::LParen)) {
            auto r = skip_balanced();
            if (is_err(r)) {
                return unwrap_err(r);
            }
            match(TokenKind::Question);
        }
        return true;
    };

    Result<bool, ParseError> shape = true;
    if (check(TokenKind::KwThis) && peek_next().is(TokenKind::Dot)) {
        shape = field_name(ParamForm::ThisField);
    } else if (check(TokenKind::KwSuper) && peek_next().is(TokenKind::Dot)) {
        shape = field_name(ParamForm::SuperField);
    } else {
        auto type = try_type_before_name();
        if (hard_error_) {
            return *hard_error_;
        }
        if (type && check(TokenKind::KwThis)) {
            param.type = std::move(type);
            shape = field_name(ParamForm::ThisField);
        } else if (type && check(TokenKind::KwSuper)) {
            param.type = std::move(type);
            shape = field_name(ParamForm::SuperField);
        } else {
            auto name = expect_identifier("Expected parameter name");
            if (is_err(name)) {
                return unwrap_err(name);
            }
            param.name = std::string(unwrap(name).lexeme);
            param.type = std::move(type);
            param.form = param.type ? ParamForm::Typed : ParamForm::Untyped;

            if (check(TokenKind::LParen)) {
                auto r = skip_balanced();
                if (is_err(r)) {
                    return unwrap_err(r);
                }
                TypeNode fn;
                fn.kind = TypeNode::Kind::Function;
                fn.nullable = match(TokenKind::Question);
                fn.text = collapse_whitespace(text_between(type_start, pos_ - 1));
                fn.span = {tokens_[type_start].span.start, previous().span.end};
                param.type = std::move(fn);
                param.form = ParamForm::FunctionTyped;
            }
        }
    }
    if (is_err(shape)) {
        return unwrap_err(shape);
    }

    if (match(TokenKind::Eq) || match(TokenKind::Colon)) {
        auto value = skip_expression(
            {TokenKind::Comma, TokenKind::RParen, TokenKind::RBracket, TokenKind::RBrace});
        if (is_err(value)) {
            return unwrap_err(value);
        }
        param.default_value = std::move(unwrap(value));
    }

    param.span.end = previous().span.end;
    return param;
}

// ============================================================================
// Annotations
// ============================================================================

auto Parser::parse_annotations() -> Result<std::vector<Annotation>, ParseError> {
    std::vector<Annotation> annotations;
    while (check(TokenKind::At)) {
        auto annotation = parse_annotation();
        if (is_err(annotation)) {
            return unwrap_err(annotation);
        }
        annotations.push_back(std::move(unwrap(annotation)));
    }
    return annotations;
}

auto Parser::parse_annotation() -> Result<Annotation, ParseError> {
    Annotation annotation;
    annotation.span.start = peek().span.start;
    advance(); // '@'

    auto name = expect_identifier("Expected annotation name");
    if (is_err(name)) {
        return unwrap_err(name);
    }
    annotation.name = std::string(unwrap(name).lexeme);

    // `@prefix.Name`, `@Name.ctor` or `@prefix.Name.ctor`.
    if (check(TokenKind::Dot) && peek_next().is(TokenKind::Identifier)) {
        advance();
        std::string second(advance().lexeme);
        if (check(TokenKind::Dot) && peek_next().is(TokenKind::Identifier)) {
            advance();
            annotation.name += "." + second;
            annotation.constructor = std::string(advance().lexeme);
        } else if (!second.empty() && std::isupper(static_cast<unsigned char>(second[0]))) {
            annotation.name += "." + second;
        } else {
            annotation.constructor = second;
        }
    }

    if (check(TokenKind::Lt)) {
        auto r = skip_angles();
        if (is_err(r)) {
            return unwrap_err(r);
        }
    }

    if (match(TokenKind::LParen)) {
        annotation.has_args = true;
        while (!check(TokenKind::RParen)) {
            AnnotationArg arg;
            if (check(TokenKind::Identifier) && peek_next().is(TokenKind::Colon)) {
                arg.name = std::string(advance().lexeme);
                advance();
            }
            auto value = skip_expression({TokenKind::Comma, TokenKind::RParen});
            if (is_err(value)) {
                return unwrap_err(value);
            }
            arg.value = std::move(unwrap(value));
            annotation.args.push_back(std::move(arg));
            if (!match(TokenKind::Comma)) {
                break;
            }
        }
        auto close = expect(TokenKind::RParen, "Expected ')' to close annotation arguments");
        if (is_err(close)) {
            return unwrap_err(close);
        }
    }

    annotation.span.end = previous().span.end;
    return annotation;
}

} // namespace sfg::parser
