//! # JSON Codec Emitter
//!
//! Produces the `JsonSerializableGenerator` section of `<stem>.g.dart`:
//! one `_$XFromJson` / `_$XToJson` pair per target followed by the enum
//! maps the pairs reference.
//!
//! ## Targets
//!
//! | Declaration | Functions | Constructed type |
//! |-------------|-----------|------------------|
//! | `@JsonSerializable` class `X` | `_$XFromJson`, `_$XToJson` | `X` |
//! | freezed case `_User` | `_$$UserImplFromJson`, `_$$UserImplToJson` | `_$UserImpl` |
//!
//! ## Decoding
//!
//! In checked mode each field is read through `$checkedConvert`, so an
//! absent or mistyped field raises `CheckedFromJsonException` carrying the
//! key and the expected type. Unchecked decoding uses plain casts.
//!
//! ## Encoding
//!
//! Keys follow declaration order. Null values of nullable fields are left
//! out unless `includeIfNull` is set.
//!
//! `checked`, `includeIfNull` and `explicitToJson` given on the class's
//! `@JsonSerializable(...)` override the configured options for that class.

#ifndef SFG_EMIT_JSON_GENERATOR_HPP
#define SFG_EMIT_JSON_GENERATOR_HPP

#include "emit/dart_writer.hpp"
#include "emit/errors.hpp"
#include "model/declaration.hpp"

#include <optional>
#include <string>
#include <vector>

namespace sfg::emit {

struct JsonOptions {
    bool checked = true;
    bool include_if_null = false;
    bool explicit_to_json = false;
};

struct JsonTarget {
    std::string declaration;   ///< Declaration the target belongs to (for diagnostics)
    std::string class_name;    ///< Type constructed by the decoder
    std::string function_stem; ///< `_$X` or `_$$XImpl`
    std::vector<const model::Parameter*> params;
    std::optional<std::string> union_key; ///< Set for freezed union cases
    std::string union_value;
    /// `@JsonSerializable(...)` arguments; unset ones fall back to the configured options.
    std::optional<bool> checked;
    std::optional<bool> include_if_null;
    std::optional<bool> explicit_to_json;
    uint32_t line = 0;
    uint32_t column = 0;
};

/// Target for a plain `@JsonSerializable` class.
[[nodiscard]] auto json_target_for_class(const model::Declaration& decl) -> JsonTarget;

/// One target per case of a freezed class with JSON support.
[[nodiscard]] auto json_targets_for_freezed(const model::Declaration& decl)
    -> std::vector<JsonTarget>;

class JsonGenerator {
public:
    JsonGenerator(const model::SourceModel& source, JsonOptions options);

    /// Emits every target followed by the referenced enum maps.
    [[nodiscard]] auto generate(const std::vector<JsonTarget>& targets) -> EmitOutput;

    /// Decode expression for `type` reading from `input`.
    [[nodiscard]] auto decode(const model::TypeDescriptor& type, const std::string& input)
        -> std::string;

    /// Decode expression falling back to `fallback` when `input` is null.
    [[nodiscard]] auto decode_or(const model::TypeDescriptor& type, const std::string& input,
                                 const std::string& fallback) -> std::string;

    /// Encode expression for `type` reading from `input`.
    [[nodiscard]] auto encode(const model::TypeDescriptor& type, const std::string& input)
        -> std::string;

    /// Reason `type` cannot be converted, `nullopt` when it can.
    [[nodiscard]] auto unsupported_reason(const model::TypeDescriptor& type) const
        -> std::optional<std::string>;

private:
    struct Decoded {
        std::string expr;     ///< Full expression honoring the type's nullability
        std::string non_null; ///< Conversion of a known non-null input
        bool ternary = false; ///< Nullable form is `input == null ? null : non_null`
    };

    const model::SourceModel& source_;
    JsonOptions defaults_;
    JsonOptions options_; ///< `defaults_` merged with the current target's arguments
    DartWriter out_;
    std::vector<UnsupportedTypeError> unsupported_;
    std::vector<std::string> used_enums_;

    auto decode_parts(const model::TypeDescriptor& type, const std::string& input) -> Decoded;
    auto decode_key(const model::TypeDescriptor& key) -> std::string;
    auto encode_key(const model::TypeDescriptor& key) -> std::string;
    auto enum_map(const std::string& enum_name) -> std::string;

    void gen_from_json(const JsonTarget& target, const std::vector<const model::Parameter*>& fields);
    void gen_to_json(const JsonTarget& target, const std::vector<const model::Parameter*>& fields);
    void gen_enum_maps();
};

} // namespace sfg::emit

#endif // SFG_EMIT_JSON_GENERATOR_HPP
