//! # Companion Assembly
//!
//! Runs the three emitters over one classified file and assembles the
//! companion files it produces.
//!
//! | Companion | Sections |
//! |-----------|----------|
//! | `<stem>.freezed.dart` | `FreezedGenerator` |
//! | `<stem>.g.dart` | `JsonSerializableGenerator`, then `RiverpodGenerator` |
//!
//! A companion is produced only when at least one declaration contributes
//! to it. Each result carries a source identity of the form
//! `<path>#<decl>,<decl>@<sha1>` so callers can compare runs cheaply.

#ifndef SFG_EMIT_COMPANION_HPP
#define SFG_EMIT_COMPANION_HPP

#include "classify/classifier.hpp"
#include "emit/errors.hpp"
#include "emit/json_generator.hpp"
#include "model/declaration.hpp"
#include "model/variant.hpp"

#include <array>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace sfg::emit {

/// First line of every generated Dart file; also used to recognize one on disk.
inline constexpr std::string_view GENERATED_HEADER = "// GENERATED CODE - DO NOT MODIFY BY HAND";

struct CompanionOptions {
    bool freezed = true;
    bool json = true;
    bool riverpod = true;
    JsonOptions json_options;
};

/// Where the companions of one source go, and how they refer back to it.
struct CompanionPaths {
    std::filesystem::path freezed;
    std::filesystem::path g;
    std::string part_of; ///< URI in `part of '...'`, relative to the companion
};

struct CompanionSet {
    std::vector<model::EmissionResult> results;
    std::vector<UnsupportedTypeError> unsupported;
    std::vector<EmitError> errors;
    /// Declarations emitted per variant, indexed by `VariantTag`.
    std::array<size_t, 3> emitted{};
    bool wants_freezed = false;
    bool wants_g = false;
};

/// Emits every enabled variant for one file.
///
/// `source_text` is the full text of the source file; it only feeds the
/// source identities.
[[nodiscard]] auto assemble_companions(const model::SourceModel& source,
                                       std::string_view source_text,
                                       const classify::ClassificationResult& classes,
                                       const CompanionPaths& paths,
                                       const CompanionOptions& options) -> CompanionSet;

/// Header of `<stem>.g.dart` up to the first section banner.
[[nodiscard]] auto g_file_header(std::string_view part_of) -> std::string;

/// The `// ****` banner naming a generator.
[[nodiscard]] auto section_banner(std::string_view generator) -> std::string;

} // namespace sfg::emit

#endif // SFG_EMIT_COMPANION_HPP
