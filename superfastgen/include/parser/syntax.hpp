//! # Dart Declaration Syntax Tree
//!
//! The concrete syntax the parser keeps for one compilation unit. Only the
//! declaration surface is modelled: function bodies, initializer lists and
//! field initializers are skipped, and expressions that matter to code
//! generation (default values, annotation arguments) are kept as raw text.
//!
//! ## Node Overview
//!
//! | Node | Dart construct |
//! |------|----------------|
//! | `TypeNode` | `int`, `List<String>?`, `void Function(int)`, `(int, String)` |
//! | `Annotation` | `@freezed`, `@JsonKey(name: 'id')` |
//! | `ParamNode` | one formal parameter |
//! | `ConstructorNode` | generative, factory and redirecting constructors |
//! | `FieldNode` | one instance or static field declarator |
//! | `MethodNode` | methods, getters, setters, operators |
//! | `ClassNode` | a class with its members in declaration order |
//! | `FunctionNode` | a top-level function |
//! | `EnumNode` | an enum and its value names |
//! | `DirectiveNode` | `library`, `import`, `export`, `part`, `part of` |

#ifndef SFG_PARSER_SYNTAX_HPP
#define SFG_PARSER_SYNTAX_HPP

#include "common.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sfg::parser {

// ============================================================================
// Types
// ============================================================================

/// A type annotation.
///
/// `text` is the canonical spelling: `Map<String, List<int>>?` regardless of
/// the whitespace in the source. Function and record types keep their
/// source text with runs of whitespace collapsed.
struct TypeNode {
    enum class Kind { Named, Function, Record };

    Kind kind = Kind::Named;
    std::string name; ///< `List`, `prefix.Type`; empty for function and record types
    std::vector<TypeNode> args;
    bool nullable = false;
    std::string text;
    SourceSpan span{};
};

/// A class or function type parameter such as `T extends Object`.
struct TypeParamNode {
    std::string name;
    std::optional<TypeNode> bound;
};

// ============================================================================
// Annotations
// ============================================================================

/// One argument of an annotation call: `name: value` or a positional value.
struct AnnotationArg {
    std::string name; ///< Empty for positional arguments
    std::string value;
};

struct Annotation {
    std::string name;        ///< `freezed`, `JsonKey`, `prefix.Thing`
    std::string constructor; ///< `@Foo.bar()` gives `bar`
    bool has_args = false;   ///< True when written with parentheses
    std::vector<AnnotationArg> args;
    SourceSpan span{};

    /// Value of the named argument `key`, if present.
    [[nodiscard]] auto arg(std::string_view key) const -> const AnnotationArg* {
        for (const auto& a : args) {
            if (a.name == key)
                return &a;
        }
        return nullptr;
    }
};

// ============================================================================
// Parameters
// ============================================================================

enum class ParamKind {
    Positional,         ///< `(int a)`
    OptionalPositional, ///< `([int a = 0])`
    Named,              ///< `({int? a})`
};

enum class ParamForm {
    Typed,         ///< `int a`, `final int a`
    ThisField,     ///< `this.a`, `int this.a`
    SuperField,    ///< `super.a`
    Untyped,       ///< `a`, `var a`, `final a`
    FunctionTyped, ///< `void callback(int x)`
};

struct ParamNode {
    std::vector<Annotation> annotations;
    ParamKind kind = ParamKind::Positional;
    ParamForm form = ParamForm::Typed;
    bool required = false; ///< The `required` modifier on a named parameter
    bool covariant = false;
    std::optional<TypeNode> type;
    std::string name;
    std::optional<std::string> default_value;
    SourceSpan span{};
};

// ============================================================================
// Class Members
// ============================================================================

struct ConstructorNode {
    std::vector<Annotation> annotations;
    bool is_const = false;
    bool is_factory = false;
    bool is_external = false;
    std::string class_name;
    std::string name; ///< Named constructor suffix; empty for the unnamed one
    std::vector<ParamNode> params;
    std::optional<std::string> redirect; ///< `= _Impl` or `= Impl.named`
    bool has_body = false;               ///< Block or `=>` body
    SourceSpan span{};
};

struct FieldNode {
    std::vector<Annotation> annotations;
    bool is_static = false;
    bool is_final = false;
    bool is_const = false;
    bool is_late = false;
    std::optional<TypeNode> type;
    std::string name;
    bool has_initializer = false;
    SourceSpan span{};
};

struct MethodNode {
    enum class Kind { Method, Getter, Setter, Operator };

    std::vector<Annotation> annotations;
    Kind kind = Kind::Method;
    bool is_static = false;
    bool is_abstract = false; ///< Declared without a body
    std::optional<TypeNode> return_type;
    std::string name;
    std::vector<TypeParamNode> type_params;
    std::vector<ParamNode> params;
    std::string async_marker; ///< "", "async", "async*" or "sync*"
    SourceSpan span{};
};

using MemberNode = std::variant<ConstructorNode, FieldNode, MethodNode>;

// ============================================================================
// Top-Level Declarations
// ============================================================================

struct ClassNode {
    std::vector<Annotation> annotations;
    std::vector<std::string> modifiers; ///< `abstract`, `sealed`, `base`, ...
    std::string name;
    std::vector<TypeParamNode> type_params;
    std::optional<TypeNode> superclass;
    std::vector<TypeNode> mixins;
    std::vector<TypeNode> interfaces;
    std::vector<MemberNode> members; ///< Declaration order
    std::vector<std::string> skipped_members; ///< Members the parser stepped over
    SourceSpan span{};
    std::string text; ///< Source text from the first annotation to the closing brace

    [[nodiscard]] auto has_modifier(std::string_view m) const -> bool {
        for (const auto& mod : modifiers) {
            if (mod == m)
                return true;
        }
        return false;
    }
};

struct FunctionNode {
    std::vector<Annotation> annotations;
    std::optional<TypeNode> return_type;
    std::string name;
    std::vector<TypeParamNode> type_params;
    std::vector<ParamNode> params;
    std::string async_marker;
    SourceSpan span{};
    std::string text;
};

struct EnumValueNode {
    std::vector<Annotation> annotations;
    std::string name;
};

struct EnumNode {
    std::vector<Annotation> annotations;
    std::string name;
    std::vector<EnumValueNode> values;
    SourceSpan span{};
};

struct DirectiveNode {
    enum class Kind { Library, Import, Export, Part, PartOf };

    Kind kind;
    std::string uri; ///< Decoded URI, or the dotted library name for `part of a.b;`
    SourceSpan span{};
};

struct TopLevelDecl {
    std::variant<ClassNode, FunctionNode, EnumNode> kind;

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() -> T& {
        return std::get<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() const -> const T& {
        return std::get<T>(kind);
    }
};

/// A parsed Dart file.
struct CompilationUnit {
    std::vector<DirectiveNode> directives;
    std::vector<TopLevelDecl> decls;
    /// Members and top-level constructs the parser stepped over (mixins,
    /// extensions, typedefs, variables, unrecognized members).
    std::vector<std::string> skipped;
};

} // namespace sfg::parser

#endif // SFG_PARSER_SYNTAX_HPP
