#include "pipeline/pipeline.hpp"

#include "classify/classifier.hpp"
#include "emit/companion.hpp"
#include "extract/extractor.hpp"
#include "lexer/source.hpp"
#include "log/log.hpp"
#include "parser/parser.hpp"
#include "pipeline/worker_pool.hpp"

#include <algorithm>
#include <exception>
#include <system_error>

namespace sfg::pipeline {

namespace {

constexpr std::string_view COMPANION_SUFFIXES[] = {".g.dart", ".freezed.dart", ".config.dart"};

auto diagnostic(report::DiagnosticKind kind, const std::string& path, std::string declaration,
                std::string message, uint32_t line = 0, uint32_t column = 0)
    -> report::Diagnostic {
    return report::Diagnostic{.kind = kind,
                              .path = path,
                              .declaration = std::move(declaration),
                              .message = std::move(message),
                              .line = line,
                              .column = column};
}

/// URI a source must use in its `part` directive to reach `companion`.
auto part_uri(const fs::path& source, const fs::path& companion) -> std::string {
    auto dir = source.lexically_normal().parent_path();
    auto rel = companion.lexically_normal().lexically_relative(dir);
    return rel.empty() ? companion.generic_string() : rel.generic_string();
}

struct Generated {
    std::vector<model::EmissionResult> results;
    bool parsed = false;
    bool wants_freezed = false;
    bool wants_g = false;
};

/// Everything after the read: parse, extract, classify and emit.
auto generate(const config::GeneratorConfig& config, const std::string& path,
              const std::string& text, report::RunReport& report) -> Generated {
    using report::DiagnosticKind;
    Generated generated;

    lexer::Source source(path, text);
    auto unit = parser::parse_source(source);
    if (is_err(unit)) {
        for (const auto& e : unwrap_err(unit)) {
            report.add(diagnostic(DiagnosticKind::Parse, path, "", e.message, e.span.start.line,
                                  e.span.start.column));
        }
        SFG_LOG_WARN("pipeline", "Skipping " << path << ": " << unwrap_err(unit).front().message);
        return generated;
    }
    generated.parsed = true;

    extract::Extractor extractor(path);
    auto extracted = extractor.extract(unwrap(unit));
    for (auto& w : extracted.warnings) {
        report.add(diagnostic(DiagnosticKind::Extraction, path, std::move(w.declaration),
                              std::move(w.message), w.line, w.column));
    }

    classify::Classifier classifier;
    auto classes = classifier.classify_all(extracted.model);
    for (auto& c : classes.conflicts) {
        report.add(diagnostic(DiagnosticKind::Conflict, path, c.declaration, std::move(c.message),
                              c.line, c.column));
    }
    for (auto& w : classes.warnings) {
        report.add(diagnostic(DiagnosticKind::Extraction, path, std::move(w.declaration),
                              std::move(w.message), w.line, w.column));
    }

    fs::path source_path(path);
    auto paths = config.companion_paths(source_path);
    auto set = emit::assemble_companions(extracted.model, text, classes, paths,
                                         config.companion_options());
    for (auto& u : set.unsupported) {
        report.add(diagnostic(DiagnosticKind::UnsupportedType, path, u.declaration,
                              u.member + ": " + u.type + ": " + u.message, u.line, u.column));
    }
    for (auto& e : set.errors) {
        report.add(diagnostic(DiagnosticKind::Emit, path, e.declaration, std::move(e.message)));
    }
    for (size_t i = 0; i < set.emitted.size(); ++i) {
        report.declarations_emitted_by_variant[i] += set.emitted[i];
    }

    for (const auto& result : set.results) {
        std::string uri = part_uri(source_path, result.target);
        if (!extracted.model.has_part(uri)) {
            report.add(diagnostic(DiagnosticKind::Extraction, path, "",
                                  "missing part directive: part '" + uri + "';"));
        }
    }
    generated.results = std::move(set.results);
    generated.wants_freezed = set.wants_freezed;
    generated.wants_g = set.wants_g;
    return generated;
}

} // anonymous namespace

// ============================================================================
// Discovery
// ============================================================================

auto is_companion_file(const fs::path& path) -> bool {
    std::string name = path.filename().string();
    return std::any_of(std::begin(COMPANION_SUFFIXES), std::end(COMPANION_SUFFIXES),
                       [&](std::string_view suffix) { return name.ends_with(suffix); });
}

auto is_source_file(const fs::path& path) -> bool {
    return path.extension() == ".dart" && !is_companion_file(path);
}

auto discover_sources(const std::vector<fs::path>& inputs, report::RunReport& report)
    -> std::vector<fs::path> {
    std::vector<fs::path> sources;
    for (const auto& input : inputs) {
        std::error_code ec;
        if (fs::is_regular_file(input, ec)) {
            if (is_source_file(input)) {
                sources.push_back(input.lexically_normal());
            }
            continue;
        }
        if (!fs::is_directory(input, ec)) {
            report.add(diagnostic(report::DiagnosticKind::Input, input.string(), "",
                                  "input path does not exist"));
            continue;
        }
        auto options = fs::directory_options::skip_permission_denied;
        for (auto it = fs::recursive_directory_iterator(input, options, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (it->is_regular_file(ec) && is_source_file(it->path())) {
                sources.push_back(it->path().lexically_normal());
            }
        }
        if (ec) {
            report.add(diagnostic(report::DiagnosticKind::Input, input.string(), "",
                                  "cannot scan directory: " + ec.message()));
        }
    }
    std::sort(sources.begin(), sources.end());
    sources.erase(std::unique(sources.begin(), sources.end()), sources.end());
    SFG_LOG_DEBUG("pipeline", "Discovered " << sources.size() << " source file(s)");
    return sources;
}

// ============================================================================
// Pipeline
// ============================================================================

Pipeline::Pipeline(config::GeneratorConfig config, io::OutputWriter& writer, fs::path config_file,
                   config::ConfigOverrides overrides)
    : config_(std::move(config)), writer_(writer), config_file_(std::move(config_file)),
      overrides_(std::move(overrides)) {}

auto Pipeline::config() const -> config::GeneratorConfig {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

auto Pipeline::generate_text(const std::string& path, const std::string& text,
                             report::RunReport& report) -> std::vector<model::EmissionResult> {
    return generate(config(), path, text, report).results;
}

auto Pipeline::process(const fs::path& source) -> report::RunReport {
    report::RunReport report;
    report.files_processed = 1;
    auto snapshot = config();
    std::string path = source.generic_string();

    auto text = io::read_file(source);
    if (!text) {
        report.add(diagnostic(report::DiagnosticKind::Parse, path, "", "cannot read source file"));
        return report;
    }

    SFG_LOG_DEBUG("pipeline", "Processing " << path);
    auto generated = generate(snapshot, path, *text, report);

    bool write_failed = false;
    for (const auto& result : generated.results) {
        auto outcome = writer_.write(result.target, result.text);
        if (is_err(outcome)) {
            const auto& e = unwrap_err(outcome);
            report.add(diagnostic(report::DiagnosticKind::Write, e.path, "", e.reason));
            write_failed = true;
            continue;
        }
        if (unwrap(outcome) == io::WriteOutcome::Written) {
            ++report.files_written;
            SFG_LOG_INFO("pipeline", "Generated " << result.target.generic_string());
        } else {
            ++report.files_unchanged;
        }
        SFG_LOG_TRACE("pipeline", "identity " << result.source_identity);
        for (auto tag : result.variants) {
            ++report.companions_by_variant[static_cast<size_t>(tag)];
        }
    }

    // Companions of variants disabled for this run are still wanted and stay.
    if (generated.parsed && !write_failed) {
        auto paths = snapshot.companion_paths(source);
        if (!generated.wants_freezed) {
            remove_stale(paths.freezed, report);
        }
        if (!generated.wants_g) {
            remove_stale(paths.g, report);
        }
    }
    return report;
}

void Pipeline::remove_stale(const fs::path& companion, report::RunReport& report) {
    if (!io::is_generated_file(companion)) {
        return;
    }
    auto removed = writer_.remove(companion);
    if (is_err(removed)) {
        const auto& e = unwrap_err(removed);
        report.add(diagnostic(report::DiagnosticKind::Write, e.path, "", e.reason));
        return;
    }
    if (unwrap(removed)) {
        ++report.files_removed;
        SFG_LOG_INFO("pipeline", "Removed stale " << companion.generic_string());
    }
}

auto Pipeline::remove_outputs(const fs::path& source) -> report::RunReport {
    report::RunReport report;
    auto paths = config().companion_paths(source);
    remove_stale(paths.freezed, report);
    remove_stale(paths.g, report);
    return report;
}

auto Pipeline::reload() -> Result<std::vector<fs::path>, config::ConfigError> {
    if (!config_file_.empty()) {
        auto loaded = config::load_config(config_file_, false);
        if (is_err(loaded)) {
            return unwrap_err(loaded);
        }
        auto next = std::move(unwrap(loaded));
        config::apply_overrides(next, overrides_);
        std::lock_guard<std::mutex> lock(config_mutex_);
        config_ = std::move(next);
    }
    report::RunReport ignored;
    auto sources = discover_sources(config().input_paths, ignored);
    for (const auto& w : ignored.warnings) {
        SFG_LOG_WARN("pipeline", w.path << ": " << w.message);
    }
    return sources;
}

auto Pipeline::run_all() -> report::RunReport {
    report::RunReport total;
    auto snapshot = config();

    if (snapshot.delete_conflicting_outputs) {
        total.merge(clean());
    }

    auto sources = discover_sources(snapshot.input_paths, total);
    if (sources.empty()) {
        return total;
    }

    std::mutex total_mutex;
    {
        WorkerPool pool(std::min(snapshot.worker_count(), sources.size()));
        for (const auto& source : sources) {
            pool.submit([this, source, &total, &total_mutex] {
                report::RunReport file_report;
                try {
                    file_report = process(source);
                } catch (const std::exception& e) {
                    SFG_LOG_ERROR("pipeline", "Processing " << source.generic_string()
                                                            << " failed: " << e.what());
                    file_report = report::RunReport{};
                    file_report.files_processed = 1;
                    file_report.add(diagnostic(report::DiagnosticKind::Emit,
                                               source.generic_string(), "",
                                               std::string("pass failed: ") + e.what()));
                }
                std::lock_guard<std::mutex> lock(total_mutex);
                total.merge(file_report);
            });
        }
        pool.wait_idle();
    }
    SFG_LOG_INFO("pipeline", "Processed " << total.files_processed << " file(s), wrote "
                                          << total.files_written);
    return total;
}

auto Pipeline::clean() -> report::RunReport {
    report::RunReport report;
    auto snapshot = config();
    std::vector<fs::path> roots = snapshot.input_paths;
    if (!snapshot.output_root.empty()) {
        roots.push_back(snapshot.output_root);
    }

    for (const auto& root : roots) {
        std::error_code ec;
        if (!fs::is_directory(root, ec)) {
            continue;
        }
        std::vector<fs::path> doomed;
        auto options = fs::directory_options::skip_permission_denied;
        for (auto it = fs::recursive_directory_iterator(root, options, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (it->is_regular_file(ec) && is_companion_file(it->path())) {
                doomed.push_back(it->path());
            }
        }
        if (ec) {
            report.add(diagnostic(report::DiagnosticKind::Input, root.string(), "",
                                  "cannot scan directory: " + ec.message()));
        }
        for (const auto& path : doomed) {
            auto removed = writer_.remove(path);
            if (is_err(removed)) {
                const auto& e = unwrap_err(removed);
                report.add(diagnostic(report::DiagnosticKind::Write, e.path, "", e.reason));
            } else if (unwrap(removed)) {
                ++report.files_removed;
            }
        }
    }
    SFG_LOG_INFO("pipeline", "Removed " << report.files_removed << " generated file(s)");
    return report;
}

} // namespace sfg::pipeline
