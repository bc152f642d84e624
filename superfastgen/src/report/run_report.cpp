#include "report/run_report.hpp"

#include "log/log.hpp"

#include <iterator>

namespace sfg::report {

auto kind_name(DiagnosticKind kind) -> std::string_view {
    switch (kind) {
    case DiagnosticKind::Input:
        return "input";
    case DiagnosticKind::Parse:
        return "parse";
    case DiagnosticKind::Extraction:
        return "extraction";
    case DiagnosticKind::Conflict:
        return "conflict";
    case DiagnosticKind::UnsupportedType:
        return "unsupported-type";
    case DiagnosticKind::Emit:
        return "emit";
    case DiagnosticKind::Write:
        return "write";
    case DiagnosticKind::Config:
        return "config";
    case DiagnosticKind::Watch:
        return "watch";
    }
    return "unknown";
}

auto severity_of(DiagnosticKind kind) -> Severity {
    switch (kind) {
    case DiagnosticKind::Input:
    case DiagnosticKind::Extraction:
    case DiagnosticKind::UnsupportedType:
        return Severity::Warning;
    case DiagnosticKind::Config:
    case DiagnosticKind::Watch:
        return Severity::Fatal;
    default:
        return Severity::Error;
    }
}

void RunReport::add(Diagnostic diagnostic) {
    switch (severity_of(diagnostic.kind)) {
    case Severity::Warning:
        warnings.push_back(std::move(diagnostic));
        break;
    case Severity::Fatal:
        fatal = true;
        errors.push_back(std::move(diagnostic));
        break;
    case Severity::Error:
        errors.push_back(std::move(diagnostic));
        break;
    }
}

void RunReport::merge(const RunReport& other) {
    files_processed += other.files_processed;
    files_written += other.files_written;
    files_unchanged += other.files_unchanged;
    files_removed += other.files_removed;
    for (size_t i = 0; i < declarations_emitted_by_variant.size(); ++i) {
        declarations_emitted_by_variant[i] += other.declarations_emitted_by_variant[i];
        companions_by_variant[i] += other.companions_by_variant[i];
    }
    warnings.insert(warnings.end(), other.warnings.begin(), other.warnings.end());
    errors.insert(errors.end(), other.errors.begin(), other.errors.end());
    fatal = fatal || other.fatal;
}

// ============================================================================
// Serialization
// ============================================================================

namespace {

void write_string(std::ostream& out, std::string_view s) {
    out << '"';
    log::write_json_escaped(out, s);
    out << '"';
}

void write_diagnostics(std::ostream& out, const std::vector<Diagnostic>& list) {
    out << '[';
    for (size_t i = 0; i < list.size(); ++i) {
        const auto& d = list[i];
        if (i > 0) {
            out << ',';
        }
        out << "{\"kind\":";
        write_string(out, kind_name(d.kind));
        out << ",\"path\":";
        write_string(out, d.path);
        out << ",\"declaration\":";
        write_string(out, d.declaration);
        out << ",\"message\":";
        write_string(out, d.message);
        out << ",\"line\":" << d.line << ",\"column\":" << d.column << '}';
    }
    out << ']';
}

constexpr model::VariantTag ALL_TAGS[] = {model::VariantTag::Immutable,
                                          model::VariantTag::JsonCodec,
                                          model::VariantTag::Provider};

} // anonymous namespace

void RunReport::write_json(std::ostream& out) const {
    out << "{\"files_processed\":" << files_processed;
    out << ",\"files_written\":" << files_written;
    out << ",\"files_unchanged\":" << files_unchanged;
    out << ",\"files_removed\":" << files_removed;
    out << ",\"declarations_emitted_by_variant\":{";
    for (size_t i = 0; i < std::size(ALL_TAGS); ++i) {
        if (i > 0) {
            out << ',';
        }
        write_string(out, model::variant_name(ALL_TAGS[i]));
        out << ':' << emitted(ALL_TAGS[i]);
    }
    out << "},\"warnings\":";
    write_diagnostics(out, warnings);
    out << ",\"errors\":";
    write_diagnostics(out, errors);
    out << ",\"fatal\":" << (fatal ? "true" : "false") << "}\n";
}

void RunReport::write_summary(std::ostream& out) const {
    for (auto tag : ALL_TAGS) {
        size_t companions = companions_by_variant[static_cast<size_t>(tag)];
        if (companions > 0) {
            out << "Generated " << companions << " companion files for variant "
                << model::variant_name(tag) << "\n";
        }
    }
    out << files_processed << " files processed, " << files_written << " written, "
        << files_unchanged << " unchanged";
    if (files_removed > 0) {
        out << ", " << files_removed << " removed";
    }
    out << ", " << warnings.size() << " warning(s), " << errors.size() << " error(s)\n";
    for (const auto& d : errors) {
        out << "  error[" << kind_name(d.kind) << "] " << d.path;
        if (d.line > 0) {
            out << ":" << d.line << ":" << d.column;
        }
        if (!d.declaration.empty()) {
            out << " (" << d.declaration << ")";
        }
        out << ": " << d.message << "\n";
    }
}

} // namespace sfg::report
