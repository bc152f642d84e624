//! # Declaration Model
//!
//! The normalized, language-neutral view of the declarations in one source
//! file. Everything downstream of extraction (classification and the three
//! emitters) reads only these types.
//!
//! | Type | Meaning |
//! |------|---------|
//! | `TypeDescriptor` | a resolved type with collection tagging |
//! | `Parameter` | one constructor or function parameter, in declaration order |
//! | `Marker` | an annotation with raw arguments |
//! | `Declaration` | a value type, plain function or stateful unit |
//! | `EnumInfo` | an enum declared in the same file |
//! | `SourceModel` | all of the above for one file |

#ifndef SFG_MODEL_DECLARATION_HPP
#define SFG_MODEL_DECLARATION_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sfg::model {

// ============================================================================
// Types
// ============================================================================

/// Selects immutability wrapping and deep equality on emission.
enum class CollectionKind { None, List, Map, Set };

enum class TypeShape {
    Named,    ///< `int`, `List<String>?`
    Function, ///< `void Function(int)`
    Record,   ///< `(int, String)`
    Inferred, ///< no type written in source
};

struct TypeDescriptor {
    std::string name;
    bool nullable = false;
    std::vector<TypeDescriptor> args;
    CollectionKind collection = CollectionKind::None;
    TypeShape shape = TypeShape::Named;
    std::string spelling; ///< Source spelling for function and record types

    /// Dart spelling, e.g. `Map<String, List<int>?>?`. Inferred types spell `dynamic`.
    [[nodiscard]] auto to_dart() const -> std::string;

    /// The same type without the trailing `?`.
    [[nodiscard]] auto non_nullable() const -> TypeDescriptor;

    /// The same type with a trailing `?` (unchanged for `dynamic`).
    [[nodiscard]] auto as_nullable() const -> TypeDescriptor;

    [[nodiscard]] auto is_collection() const -> bool {
        return collection != CollectionKind::None;
    }

    /// `dynamic`, `Object?`, `Null` and inferred types accept null without a `?`.
    [[nodiscard]] auto accepts_null() const -> bool;

    /// Builds a named type, tagging `List`, `Map` and `Set` as collections.
    [[nodiscard]] static auto named(std::string name, std::vector<TypeDescriptor> args = {},
                                    bool nullable = false) -> TypeDescriptor;

    [[nodiscard]] static auto inferred() -> TypeDescriptor;

    [[nodiscard]] auto operator==(const TypeDescriptor& other) const -> bool = default;
};

/// Collection kind implied by a type name (`List`, `Map`, `Set`).
[[nodiscard]] auto collection_kind_for(std::string_view name) -> CollectionKind;

// ============================================================================
// Parameters and Markers
// ============================================================================

enum class ParameterKind { Positional, OptionalPositional, Named };

struct Parameter {
    std::string name;
    TypeDescriptor type;
    ParameterKind kind = ParameterKind::Named;
    bool required = false;
    std::optional<std::string> default_value;

    /// JSON key; equals `name` unless renamed with `@JsonKey(name:)`.
    std::string json_key;
    bool json_ignored = false;
    std::optional<bool> include_if_null;     ///< `@JsonKey(includeIfNull:)`
    std::optional<std::string> json_default; ///< `@JsonKey(defaultValue:)`

    [[nodiscard]] auto is_named() const -> bool {
        return kind == ParameterKind::Named;
    }

    /// Default used when decoding a missing key: `@JsonKey(defaultValue:)`,
    /// then the constructor default.
    [[nodiscard]] auto decode_default() const -> const std::optional<std::string>& {
        return json_default ? json_default : default_value;
    }
};

struct MarkerArg {
    std::string name; ///< Empty for positional arguments
    std::string value;
};

/// An annotation attached to a declaration. Arguments are raw source text.
struct Marker {
    std::string name;
    std::vector<MarkerArg> args;

    [[nodiscard]] auto arg(std::string_view key) const -> const MarkerArg* {
        for (const auto& a : args) {
            if (a.name == key)
                return &a;
        }
        return nullptr;
    }

    /// True when the named argument is present with the literal value `true`.
    [[nodiscard]] auto flag(std::string_view key) const -> bool {
        const auto* a = arg(key);
        return a && a->value == "true";
    }
};

// ============================================================================
// Declarations
// ============================================================================

enum class DeclarationKind { ValueType, PlainFunction, StatefulUnit };

/// One factory of an immutable value type. Non-union classes have a single
/// case with an empty name.
struct UnionCase {
    std::string name;     ///< Constructor name (`success`), empty for the unnamed factory
    std::string redirect; ///< Implementation class name (`_Success`, `Success`)
    std::vector<Parameter> params;
    bool is_const = false;
};

struct Declaration {
    DeclarationKind kind = DeclarationKind::ValueType;
    std::string name;
    std::vector<Marker> markers;

    /// Value types: parameters of the unnamed (or backing) constructor.
    std::vector<Parameter> constructor_params;
    /// Functions: all parameters. Units: the `build` parameters.
    std::vector<Parameter> params;
    /// Functions and units: declared return type of the function or `build`.
    std::optional<TypeDescriptor> return_type;

    std::vector<UnionCase> union_cases;
    std::vector<std::string> type_params;
    std::string redirect_name;
    std::string union_key = "runtimeType";
    std::string async_marker;
    bool has_from_json = false;
    bool has_private_constructor = false;
    bool is_abstract = false;

    std::string source_text;
    uint32_t line = 0;
    uint32_t column = 0;

    [[nodiscard]] auto is_union() const -> bool {
        return union_cases.size() > 1 || (union_cases.size() == 1 && !union_cases[0].name.empty());
    }

    [[nodiscard]] auto marker(std::string_view marker_name) const -> const Marker* {
        for (const auto& m : markers) {
            if (m.name == marker_name)
                return &m;
        }
        return nullptr;
    }
};

struct EnumInfo {
    std::string name;
    std::vector<std::string> values;
    /// `@JsonValue(...)` overrides, same length as `values`; empty entries use the name.
    std::vector<std::string> json_values;
};

/// Everything extracted from one source file.
struct SourceModel {
    std::string path;
    std::vector<Declaration> declarations;
    std::vector<EnumInfo> enums;
    std::vector<std::string> part_directives; ///< URIs of `part '...'` directives

    [[nodiscard]] auto find_enum(std::string_view name) const -> const EnumInfo* {
        for (const auto& e : enums) {
            if (e.name == name)
                return &e;
        }
        return nullptr;
    }

    [[nodiscard]] auto has_part(std::string_view uri) const -> bool {
        for (const auto& p : part_directives) {
            if (p == uri)
                return true;
        }
        return false;
    }
};

} // namespace sfg::model

#endif // SFG_MODEL_DECLARATION_HPP
