//! # Run Report
//!
//! The structured outcome of one generation pass: counters, every warning
//! and every error, whichever stage raised it.
//!
//! | Diagnostic kind | Raised by | Severity |
//! |-----------------|-----------|----------|
//! | `input` | source discovery | warning |
//! | `parse` | grammar adapter | error |
//! | `extraction` | extractor, classifier | warning |
//! | `conflict` | classifier | error |
//! | `unsupported-type` | emitters | warning |
//! | `emit` | emitters | error |
//! | `write` | output writer | error |
//! | `config` | configuration loader | fatal |
//! | `watch` | watcher | fatal |
//!
//! Reports from parallel tasks are combined with `merge()`.

#ifndef SFG_REPORT_RUN_REPORT_HPP
#define SFG_REPORT_RUN_REPORT_HPP

#include "model/variant.hpp"

#include <array>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace sfg::report {

enum class DiagnosticKind {
    Input,
    Parse,
    Extraction,
    Conflict,
    UnsupportedType,
    Emit,
    Write,
    Config,
    Watch
};

enum class Severity { Warning, Error, Fatal };

[[nodiscard]] auto kind_name(DiagnosticKind kind) -> std::string_view;
[[nodiscard]] auto severity_of(DiagnosticKind kind) -> Severity;

struct Diagnostic {
    DiagnosticKind kind = DiagnosticKind::Extraction;
    std::string path;
    std::string declaration;
    std::string message;
    uint32_t line = 0;
    uint32_t column = 0;
};

struct RunReport {
    size_t files_processed = 0;
    size_t files_written = 0;
    size_t files_unchanged = 0;
    size_t files_removed = 0;
    /// Indexed by `model::VariantTag`.
    std::array<size_t, 3> declarations_emitted_by_variant{};
    /// Companion files written or confirmed unchanged, indexed by `model::VariantTag`.
    std::array<size_t, 3> companions_by_variant{};
    std::vector<Diagnostic> warnings;
    std::vector<Diagnostic> errors;
    bool fatal = false;

    /// Files the diagnostic to `warnings` or `errors` by its severity.
    void add(Diagnostic diagnostic);

    void merge(const RunReport& other);

    [[nodiscard]] auto emitted(model::VariantTag tag) const -> size_t {
        return declarations_emitted_by_variant[static_cast<size_t>(tag)];
    }

    [[nodiscard]] auto has_errors() const -> bool {
        return fatal || !errors.empty();
    }

    /// Serializes the report as one JSON object.
    void write_json(std::ostream& out) const;

    /// Human summary: one "Generated N companion files for variant V" line per
    /// variant, then the totals.
    void write_summary(std::ostream& out) const;
};

} // namespace sfg::report

#endif // SFG_REPORT_RUN_REPORT_HPP
