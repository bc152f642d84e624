//! # Generation Variants
//!
//! The closed set of generation strategies a declaration can resolve to,
//! and the emitted text that results from one.

#ifndef SFG_MODEL_VARIANT_HPP
#define SFG_MODEL_VARIANT_HPP

#include <filesystem>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sfg::model {

/// Immutable value boilerplate (`.freezed.dart`).
struct ImmutableVariant {
    /// The class also wants JSON support through its generated implementation.
    bool with_json = false;
};

/// JSON codec functions for a plain class (`.g.dart`).
struct JsonCodecVariant {};

/// Reactive provider boilerplate (`.g.dart`).
struct ProviderVariant {
    bool is_family = false;
    bool is_unit = false;
    bool keep_alive = false;
};

using GenerationVariant = std::variant<ImmutableVariant, JsonCodecVariant, ProviderVariant>;

enum class VariantTag { Immutable, JsonCodec, Provider };

[[nodiscard]] inline auto variant_tag(const GenerationVariant& v) -> VariantTag {
    return static_cast<VariantTag>(v.index());
}

/// User-facing name: `freezed`, `json`, `riverpod`.
[[nodiscard]] inline auto variant_name(VariantTag tag) -> std::string_view {
    switch (tag) {
    case VariantTag::Immutable:
        return "freezed";
    case VariantTag::JsonCodec:
        return "json";
    case VariantTag::Provider:
        return "riverpod";
    }
    return "unknown";
}

/// Generated text destined for one companion file.
struct EmissionResult {
    std::filesystem::path target;
    std::string text;
    /// `<source path>#<decl>,<decl>@<sha1 of source>`; equal identities imply equal text.
    std::string source_identity;
    /// Variants that contributed sections to `text`.
    std::vector<VariantTag> variants;
};

} // namespace sfg::model

#endif // SFG_MODEL_VARIANT_HPP
