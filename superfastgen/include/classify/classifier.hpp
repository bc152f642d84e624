//! # Marker Classifier
//!
//! Resolves the markers on each extracted declaration to at most one
//! `GenerationVariant`.
//!
//! | Markers | Variant |
//! |---------|---------|
//! | `@freezed` / `@Freezed(...)` | `Immutable` |
//! | `@freezed` + `@JsonSerializable` or a `fromJson` factory | `Immutable{with_json}` |
//! | `@JsonSerializable(...)` | `JsonCodec` |
//! | `@riverpod` / `@Riverpod(...)` on a function | `Provider{is_family?}` |
//! | `@riverpod` on a class extending `_$Name` | `Provider{is_unit, is_family?}` |
//! | provider marker together with either other marker | `ConflictError` |
//!
//! A provider function's context parameter is a first parameter named `ref`
//! or typed `Ref`/`*Ref`. Any other parameter makes the function a family.

#ifndef SFG_CLASSIFY_CLASSIFIER_HPP
#define SFG_CLASSIFY_CLASSIFIER_HPP

#include "common.hpp"
#include "extract/extractor.hpp"
#include "model/declaration.hpp"
#include "model/variant.hpp"

#include <optional>
#include <string>
#include <vector>

namespace sfg::classify {

/// Mutually exclusive markers on one declaration.
struct ConflictError {
    std::string declaration;
    std::vector<std::string> markers;
    std::string message;
    uint32_t line = 0;
    uint32_t column = 0;
};

/// Recognized marker families.
enum class MarkerKind { Immutable, Json, Provider };

/// Maps a marker name to its family, `nullopt` for unrecognized annotations.
[[nodiscard]] auto recognize_marker(std::string_view name) -> std::optional<MarkerKind>;

struct ClassifiedDeclaration {
    const model::Declaration* declaration = nullptr;
    model::GenerationVariant variant;
};

struct ClassificationResult {
    std::vector<ClassifiedDeclaration> classified;
    std::vector<ConflictError> conflicts;
    std::vector<extract::ExtractionWarning> warnings;

    /// Classified declarations resolving to `tag`, in source order.
    [[nodiscard]] auto with_tag(model::VariantTag tag) const
        -> std::vector<const ClassifiedDeclaration*>;
};

class Classifier {
public:
    /// Classifies a single declaration. `Ok(nullopt)` means nothing to generate.
    [[nodiscard]] auto classify(const model::Declaration& decl)
        -> Result<std::optional<model::GenerationVariant>, ConflictError>;

    /// Classifies every declaration in a file. Conflicts skip only their own declaration.
    [[nodiscard]] auto classify_all(const model::SourceModel& source) -> ClassificationResult;

    [[nodiscard]] auto warnings() const -> const std::vector<extract::ExtractionWarning>& {
        return warnings_;
    }

private:
    std::vector<extract::ExtractionWarning> warnings_;

    void warn(const model::Declaration& decl, std::string message);
    auto classify_provider(const model::Declaration& decl) -> std::optional<model::ProviderVariant>;
};

// ============================================================================
// Provider Parameters
// ============================================================================

/// Index of the provider context parameter (`ref`), if the function has one.
[[nodiscard]] auto context_param_index(const model::Declaration& decl) -> std::optional<size_t>;

/// Parameters that key a family: all parameters except the context parameter.
[[nodiscard]] auto family_params(const model::Declaration& decl) -> std::vector<model::Parameter>;

} // namespace sfg::classify

#endif // SFG_CLASSIFY_CLASSIFIER_HPP
