//! # Declaration Parsing
//!
//! Directives, classes and their members, enums and top-level functions.
//! Mixins, extensions, typedefs and top-level variables are stepped over
//! and listed in `CompilationUnit::skipped`.

#include "parser/parser.hpp"

#include "log/log.hpp"

namespace sfg::parser {

using lexer::TokenKind;

namespace {

auto is_class_modifier(const lexer::Token& tok) -> bool {
    if (tok.is(TokenKind::KwFinal)) {
        return true;
    }
    return tok.is_word("abstract") || tok.is_word("sealed") || tok.is_word("base") ||
           tok.is_word("interface") || tok.is_word("mixin") || tok.is_word("augment");
}

} // anonymous namespace

// ============================================================================
// Directives
// ============================================================================

auto Parser::at_directive() const -> bool {
    const auto& next = peek_next();
    if (check_word("import") || check_word("export")) {
        return next.is(TokenKind::StringLiteral);
    }
    if (check_word("part")) {
        return next.is(TokenKind::StringLiteral) || next.is_word("of");
    }
    if (check_word("library")) {
        return next.is(TokenKind::Identifier) || next.is(TokenKind::Semi);
    }
    return false;
}

auto Parser::parse_directive() -> Result<DirectiveNode, ParseError> {
    DirectiveNode directive{.kind = DirectiveNode::Kind::Library, .uri = {}, .span = {}};
    directive.span.start = peek().span.start;

    auto keyword = advance().lexeme;
    if (keyword == "import") {
        directive.kind = DirectiveNode::Kind::Import;
    } else if (keyword == "export") {
        directive.kind = DirectiveNode::Kind::Export;
    } else if (keyword == "part") {
        directive.kind = match_word("of") ? DirectiveNode::Kind::PartOf : DirectiveNode::Kind::Part;
    }

    if (check(TokenKind::StringLiteral)) {
        auto value = peek().string_value();
        directive.uri = value ? *value : std::string(peek().lexeme);
        advance();
    } else {
        while (check(TokenKind::Identifier)) {
            directive.uri += advance().lexeme;
            if (check(TokenKind::Dot) && peek_next().is(TokenKind::Identifier)) {
                directive.uri += advance().lexeme;
            }
        }
    }

    auto rest = skip_expression({TokenKind::Semi});
    if (is_err(rest)) {
        return unwrap_err(rest);
    }
    auto semi = expect(TokenKind::Semi, "Expected ';' after directive");
    if (is_err(semi)) {
        return unwrap_err(semi);
    }
    directive.span.end = previous().span.end;
    return directive;
}

// ============================================================================
// Classes
// ============================================================================

auto Parser::at_class_header() const -> bool {
    size_t i = 0;
    while (is_class_modifier(peek_at(i))) {
        ++i;
    }
    return peek_at(i).is(TokenKind::KwClass);
}

auto Parser::parse_class(std::vector<Annotation> annotations, size_t start)
    -> Result<std::optional<ClassNode>, ParseError> {
    ClassNode cls;
    cls.annotations = std::move(annotations);
    cls.span.start = tokens_[start].span.start;

    while (is_class_modifier(peek())) {
        cls.modifiers.emplace_back(advance().lexeme);
    }
    advance(); // class

    auto name = expect_identifier("Expected class name");
    if (is_err(name)) {
        return unwrap_err(name);
    }
    cls.name = std::string(unwrap(name).lexeme);

    auto type_params = parse_type_params();
    if (is_err(type_params)) {
        return unwrap_err(type_params);
    }
    cls.type_params = std::move(unwrap(type_params));

    // Mixin application: `class A = B with C;`
    if (check(TokenKind::Eq)) {
        auto skipped = skip_declaration();
        if (is_err(skipped)) {
            return unwrap_err(skipped);
        }
        return std::optional<ClassNode>{};
    }

    auto type_list = [this](std::vector<TypeNode>& out) -> Result<bool, ParseError> {
        do {
            auto type = parse_type();
            if (is_err(type)) {
                return unwrap_err(type);
            }
            out.push_back(std::move(unwrap(type)));
        } while (match(TokenKind::Comma));
        return true;
    };

    if (match(TokenKind::KwExtends)) {
        auto super = parse_type();
        if (is_err(super)) {
            return unwrap_err(super);
        }
        cls.superclass = std::move(unwrap(super));
    }
    if (match(TokenKind::KwWith)) {
        auto r = type_list(cls.mixins);
        if (is_err(r)) {
            return unwrap_err(r);
        }
    }
    if (match_word("implements")) {
        auto r = type_list(cls.interfaces);
        if (is_err(r)) {
            return unwrap_err(r);
        }
    }

    auto open = expect(TokenKind::LBrace, "Expected '{' to start class body");
    if (is_err(open)) {
        return unwrap_err(open);
    }

    while (!check(TokenKind::RBrace)) {
        if (is_at_end()) {
            return hard(error_here("Unbalanced delimiters: class '" + cls.name +
                                   "' is missing its closing '}'"));
        }
        size_t member_start = pos_;
        auto member = parse_member(cls);
        if (hard_error_) {
            return *hard_error_;
        }
        if (is_err(member)) {
            // Step over what we could not understand and keep going.
            const auto& error = unwrap_err(member);
            pos_ = member_start;
            auto skipped = skip_declaration();
            if (is_err(skipped)) {
                return unwrap_err(skipped);
            }
            if (pos_ == member_start) {
                advance();
            }
            SFG_LOG_DEBUG("parser", "Skipped member of " << cls.name << ": " << error.message);
            cls.skipped_members.push_back(unwrap(skipped).empty() ? error.message
                                                                  : unwrap(skipped));
        }
    }
    advance(); // '}'

    cls.span.end = previous().span.end;
    cls.text = text_between(start, pos_ - 1);
    return std::optional<ClassNode>{std::move(cls)};
}

auto Parser::parse_member(ClassNode& cls) -> Result<bool, ParseError> {
    if (match(TokenKind::Semi)) {
        return true;
    }

    auto member_start = peek().span.start;
    auto annotations = parse_annotations();
    if (is_err(annotations)) {
        return unwrap_err(annotations);
    }

    bool is_static = false;
    bool is_final = false;
    bool is_const = false;
    bool is_late = false;
    bool is_external = false;
    bool is_factory = false;

    // A modifier word directly followed by '(' or ';' is a member name.
    auto modifier_word = [this](std::string_view word) {
        return check_word(word) &&
               !peek_next().is_one_of({TokenKind::LParen, TokenKind::Semi, TokenKind::Eq});
    };

    while (true) {
        if (modifier_word("static")) {
            is_static = true;
        } else if (check(TokenKind::KwFinal)) {
            is_final = true;
        } else if (check(TokenKind::KwConst)) {
            is_const = true;
        } else if (modifier_word("late")) {
            is_late = true;
        } else if (modifier_word("external")) {
            is_external = true;
        } else if (modifier_word("factory")) {
            is_factory = true;
        } else if (modifier_word("abstract") || modifier_word("covariant") ||
                   check(TokenKind::KwVar)) {
        } else {
            break;
        }
        advance();
    }

    // Constructors: `Name(`, `Name.named(`, optionally after const/factory.
    if (check(TokenKind::Identifier) && peek().lexeme == cls.name &&
        peek_next().is_one_of({TokenKind::LParen, TokenKind::Dot})) {
        auto ctor = parse_constructor(std::move(unwrap(annotations)), is_const, is_factory,
                                      is_external, cls.name);
        if (is_err(ctor)) {
            return unwrap_err(ctor);
        }
        unwrap(ctor).span.start = member_start;
        cls.members.emplace_back(std::move(unwrap(ctor)));
        return true;
    }

    MethodNode method;
    method.annotations = std::move(unwrap(annotations));
    method.is_static = is_static;

    bool untyped_accessor =
        (check_word("get") || check_word("set")) && peek_next().is(TokenKind::Identifier) &&
        peek_at(2).is_one_of(
            {TokenKind::Arrow, TokenKind::LBrace, TokenKind::LParen, TokenKind::Semi});

    if (!untyped_accessor) {
        method.return_type = try_type_before_name();
        if (hard_error_) {
            return *hard_error_;
        }
    }

    if (check_word("operator") && !peek_next().is(TokenKind::LParen)) {
        advance();
        method.kind = MethodNode::Kind::Operator;
        method.name = "operator";
        while (!check(TokenKind::LParen)) {
            if (is_at_end() || check(TokenKind::Semi) || check(TokenKind::LBrace)) {
                return error_here("Expected operator parameter list");
            }
            method.name += advance().lexeme;
        }
    } else if ((check_word("get") || check_word("set")) &&
               peek_next().is(TokenKind::Identifier)) {
        method.kind = advance().lexeme == "get" ? MethodNode::Kind::Getter
                                                : MethodNode::Kind::Setter;
        method.name = std::string(advance().lexeme);
    } else if (check(TokenKind::Identifier)) {
        auto name = std::string(advance().lexeme);

        if (!check(TokenKind::LParen) && !check(TokenKind::Lt)) {
            // Field declarators: `Type a = 1, b;`
            std::vector<FieldNode> fields;
            while (true) {
                FieldNode field;
                field.annotations = method.annotations;
                field.is_static = is_static;
                field.is_final = is_final;
                field.is_const = is_const;
                field.is_late = is_late;
                field.type = method.return_type;
                field.name = name;
                field.span.start = member_start;
                if (match(TokenKind::Eq)) {
                    auto init = skip_expression({TokenKind::Comma, TokenKind::Semi});
                    if (is_err(init)) {
                        return unwrap_err(init);
                    }
                    field.has_initializer = true;
                }
                field.span.end = previous().span.end;
                fields.push_back(std::move(field));
                if (!match(TokenKind::Comma)) {
                    break;
                }
                auto next = expect_identifier("Expected field name");
                if (is_err(next)) {
                    return unwrap_err(next);
                }
                name = std::string(unwrap(next).lexeme);
            }
            auto semi = expect(TokenKind::Semi, "Expected ';' after field declaration");
            if (is_err(semi)) {
                return unwrap_err(semi);
            }
            for (auto& field : fields) {
                cls.members.emplace_back(std::move(field));
            }
            return true;
        }
        method.name = std::move(name);
    } else {
        return error_here("Unrecognized class member starting with '" +
                          std::string(peek().lexeme) + "'");
    }

    auto type_params = parse_type_params();
    if (is_err(type_params)) {
        return unwrap_err(type_params);
    }
    method.type_params = std::move(unwrap(type_params));

    if (method.kind != MethodNode::Kind::Getter) {
        auto params = parse_params();
        if (is_err(params)) {
            return unwrap_err(params);
        }
        method.params = std::move(unwrap(params));
    }

    method.async_marker = parse_async_marker();
    auto body = skip_function_body();
    if (is_err(body)) {
        return unwrap_err(body);
    }
    method.is_abstract = !unwrap(body) && !is_external;
    method.span = {member_start, previous().span.end};
    cls.members.emplace_back(std::move(method));
    return true;
}

auto Parser::parse_constructor(std::vector<Annotation> annotations, bool is_const,
                               bool is_factory, bool is_external, const std::string& class_name)
    -> Result<ConstructorNode, ParseError> {
    ConstructorNode ctor;
    ctor.annotations = std::move(annotations);
    ctor.is_const = is_const;
    ctor.is_factory = is_factory;
    ctor.is_external = is_external;
    ctor.class_name = class_name;
    advance(); // class name

    if (match(TokenKind::Dot)) {
        auto name = expect_identifier("Expected constructor name");
        if (is_err(name)) {
            return unwrap_err(name);
        }
        ctor.name = std::string(unwrap(name).lexeme);
    }

    auto params = parse_params();
    if (is_err(params)) {
        return unwrap_err(params);
    }
    ctor.params = std::move(unwrap(params));

    if (match(TokenKind::Eq)) {
        // Redirecting factory: `= _Impl;`, `= Impl.named;`, `= _Impl<T>;`
        auto target = expect_identifier("Expected redirect target");
        if (is_err(target)) {
            return unwrap_err(target);
        }
        std::string redirect(unwrap(target).lexeme);
        if (check(TokenKind::Lt)) {
            auto r = skip_angles();
            if (is_err(r)) {
                return unwrap_err(r);
            }
        }
        if (match(TokenKind::Dot)) {
            auto named = expect_identifier("Expected redirect constructor name");
            if (is_err(named)) {
                return unwrap_err(named);
            }
            redirect += "." + std::string(unwrap(named).lexeme);
        }
        ctor.redirect = std::move(redirect);
        auto semi = expect(TokenKind::Semi, "Expected ';' after redirecting constructor");
        if (is_err(semi)) {
            return unwrap_err(semi);
        }
    } else {
        if (match(TokenKind::Colon)) {
            auto init = skip_expression({TokenKind::LBrace, TokenKind::Semi, TokenKind::Arrow});
            if (is_err(init)) {
                return unwrap_err(init);
            }
        }
        auto body = skip_function_body();
        if (is_err(body)) {
            return unwrap_err(body);
        }
        ctor.has_body = unwrap(body);
    }

    ctor.span.end = previous().span.end;
    return ctor;
}

// ============================================================================
// Enums
// ============================================================================

auto Parser::parse_enum(std::vector<Annotation> annotations) -> Result<EnumNode, ParseError> {
    EnumNode en;
    en.annotations = std::move(annotations);
    en.span.start = peek().span.start;
    advance(); // enum

    auto name = expect_identifier("Expected enum name");
    if (is_err(name)) {
        return unwrap_err(name);
    }
    en.name = std::string(unwrap(name).lexeme);

    // Type parameters, `with` and `implements` clauses.
    while (!check(TokenKind::LBrace)) {
        if (is_at_end() || check(TokenKind::Semi)) {
            return error_here("Expected '{' to start enum body");
        }
        advance();
    }
    advance();

    while (!check(TokenKind::RBrace)) {
        if (is_at_end()) {
            return hard(error_here("Unbalanced delimiters: enum '" + en.name +
                                   "' is missing its closing '}'"));
        }
        if (match(TokenKind::Semi)) {
            // Enhanced enum members follow; step over them.
            while (!check(TokenKind::RBrace)) {
                if (is_at_end()) {
                    return hard(error_here("Unbalanced delimiters: enum '" + en.name +
                                           "' is missing its closing '}'"));
                }
                if (check(TokenKind::LParen) || check(TokenKind::LBracket) ||
                    check(TokenKind::LBrace)) {
                    auto r = skip_balanced();
                    if (is_err(r)) {
                        return unwrap_err(r);
                    }
                } else if (check(TokenKind::RParen) || check(TokenKind::RBracket)) {
                    return hard(error_here("Unbalanced delimiters: unexpected '" +
                                           std::string(peek().lexeme) + "'"));
                } else {
                    advance();
                }
            }
            break;
        }

        auto value_annotations = parse_annotations();
        if (is_err(value_annotations)) {
            return unwrap_err(value_annotations);
        }
        auto value = expect_identifier("Expected enum value");
        if (is_err(value)) {
            return unwrap_err(value);
        }
        en.values.push_back(EnumValueNode{.annotations = std::move(unwrap(value_annotations)),
                                          .name = std::string(unwrap(value).lexeme)});

        if (check(TokenKind::Lt)) {
            auto r = skip_angles();
            if (is_err(r)) {
                return unwrap_err(r);
            }
        }
        if (match(TokenKind::Dot)) {
            auto ctor = expect_identifier("Expected constructor name");
            if (is_err(ctor)) {
                return unwrap_err(ctor);
            }
        }
        if (check(TokenKind::LParen)) {
            auto r = skip_balanced();
            if (is_err(r)) {
                return unwrap_err(r);
            }
        }
        if (!match(TokenKind::Comma) && !check(TokenKind::Semi) && !check(TokenKind::RBrace)) {
            return error_here("Expected ',' or '}' after enum value");
        }
    }
    advance(); // '}'

    en.span.end = previous().span.end;
    return en;
}

// ============================================================================
// Top Level
// ============================================================================

auto Parser::parse_top_level(std::vector<Annotation> annotations, size_t start,
                             CompilationUnit& unit) -> Result<bool, ParseError> {
    auto skip = [&]() -> Result<bool, ParseError> {
        auto skipped = skip_declaration();
        if (is_err(skipped)) {
            return unwrap_err(skipped);
        }
        unit.skipped.push_back(std::move(unwrap(skipped)));
        return true;
    };

    if (check_word("typedef") || check_word("mixin") || check_word("extension") ||
        check(TokenKind::KwFinal) || check(TokenKind::KwConst) || check(TokenKind::KwVar) ||
        check_word("late")) {
        return skip();
    }
    match_word("external");

    auto return_type = try_type_before_name();
    if (hard_error_) {
        return *hard_error_;
    }

    if ((check_word("get") || check_word("set")) && peek_next().is(TokenKind::Identifier)) {
        return skip();
    }
    if (!check(TokenKind::Identifier)) {
        std::string found = is_at_end() ? "end of file" : std::string(peek().lexeme);
        return error_here("Unexpected '" + found + "' at top level");
    }

    auto name_token = advance();
    if (!check(TokenKind::LParen) && !check(TokenKind::Lt)) {
        return skip(); // a top-level variable with an explicit type
    }

    FunctionNode fn;
    fn.annotations = std::move(annotations);
    fn.return_type = std::move(return_type);
    fn.name = std::string(name_token.lexeme);

    auto type_params = parse_type_params();
    if (is_err(type_params)) {
        return unwrap_err(type_params);
    }
    fn.type_params = std::move(unwrap(type_params));

    auto params = parse_params();
    if (is_err(params)) {
        return unwrap_err(params);
    }
    fn.params = std::move(unwrap(params));
    fn.async_marker = parse_async_marker();

    auto body = skip_function_body();
    if (is_err(body)) {
        return unwrap_err(body);
    }

    fn.span = {tokens_[start].span.start, previous().span.end};
    fn.text = text_between(start, pos_ - 1);
    unit.decls.push_back(TopLevelDecl{std::move(fn)});
    return true;
}

} // namespace sfg::parser
