//! # Declaration Extractor
//!
//! Walks a parsed `CompilationUnit` and builds the `SourceModel` the
//! classifier and emitters consume.
//!
//! ## What Gets Extracted
//!
//! | Source construct | Result |
//! |------------------|--------|
//! | annotated class | `DeclarationKind::ValueType` |
//! | annotated class extending `_$Name` with a `build` method | `DeclarationKind::StatefulUnit` |
//! | annotated top-level function | `DeclarationKind::PlainFunction` |
//! | enum | `EnumInfo` (for JSON enum maps) |
//! | `part '...'` | `SourceModel::part_directives` |
//!
//! Declarations without any annotation never need generated code and are
//! left out. Parameters keep declaration order. Anything only partially
//! understood produces an `ExtractionWarning` and best-effort data.

#ifndef SFG_EXTRACT_EXTRACTOR_HPP
#define SFG_EXTRACT_EXTRACTOR_HPP

#include "model/declaration.hpp"
#include "parser/syntax.hpp"

#include <string>
#include <vector>

namespace sfg::extract {

struct ExtractionWarning {
    std::string declaration;
    std::string message;
    uint32_t line = 0;
    uint32_t column = 0;
};

struct ExtractionResult {
    model::SourceModel model;
    std::vector<ExtractionWarning> warnings;
};

class Extractor {
public:
    explicit Extractor(std::string path);

    [[nodiscard]] auto extract(const parser::CompilationUnit& unit) -> ExtractionResult;

private:
    std::string path_;
    std::vector<ExtractionWarning> warnings_;

    void warn(const std::string& declaration, const SourceSpan& span, std::string message);

    auto extract_class(const parser::ClassNode& cls) -> model::Declaration;
    auto extract_function(const parser::FunctionNode& fn) -> model::Declaration;
    auto extract_enum(const parser::EnumNode& en) -> model::EnumInfo;

    /// Converts a parameter list, dropping duplicates. `fields` resolves `this.x` types.
    auto extract_params(const std::string& owner, const std::vector<parser::ParamNode>& params,
                        const std::vector<const parser::FieldNode*>& fields)
        -> std::vector<model::Parameter>;

    void extract_value_type(const parser::ClassNode& cls, model::Declaration& decl);
    void extract_unit(const parser::ClassNode& cls, model::Declaration& decl);
};

// ============================================================================
// Conversion Helpers
// ============================================================================

[[nodiscard]] auto to_type_descriptor(const parser::TypeNode& node) -> model::TypeDescriptor;

[[nodiscard]] auto to_marker(const parser::Annotation& annotation) -> model::Marker;

/// Strips the quotes from a simple string literal (`'a'`, `"a"`, `r'a'`).
/// Returns the text unchanged when it is not a quoted literal.
[[nodiscard]] auto unquote(std::string_view literal) -> std::string;

} // namespace sfg::extract

#endif // SFG_EXTRACT_EXTRACTOR_HPP
