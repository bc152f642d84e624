//! # Generation Pipeline
//!
//! Drives one source file through every stage and writes its companions.
//!
//! ```text
//! read → parse_source → Extractor → Classifier → assemble_companions → OutputWriter
//! ```
//!
//! Every failure is scoped to its file and lands in the returned
//! `RunReport`; nothing here aborts a batch.
//!
//! ## Batch Runs
//!
//! `run_all()` discovers the sources under the configured inputs and hands
//! one task per file to a `WorkerPool`. The stages for a single file always
//! run sequentially inside its task.

#ifndef SFG_PIPELINE_PIPELINE_HPP
#define SFG_PIPELINE_PIPELINE_HPP

#include "common.hpp"
#include "config/config.hpp"
#include "io/output_writer.hpp"
#include "report/run_report.hpp"

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace sfg::pipeline {

namespace fs = std::filesystem;

/// What the regeneration coordinator needs from a pipeline.
class SourceProcessor {
public:
    virtual ~SourceProcessor() = default;

    /// Regenerates the companions of one source.
    [[nodiscard]] virtual auto process(const fs::path& source) -> report::RunReport = 0;

    /// Removes the generated companions of a deleted source.
    [[nodiscard]] virtual auto remove_outputs(const fs::path& source) -> report::RunReport = 0;

    /// Re-reads the configuration and returns every source to regenerate.
    [[nodiscard]] virtual auto reload() -> Result<std::vector<fs::path>, config::ConfigError> = 0;
};

/// True for `*.g.dart`, `*.freezed.dart` and `*.config.dart`.
[[nodiscard]] auto is_companion_file(const fs::path& path) -> bool;

/// True for `.dart` files that are not companions.
[[nodiscard]] auto is_source_file(const fs::path& path) -> bool;

/// Sources under `inputs`, sorted. Missing inputs are reported in `report`.
[[nodiscard]] auto discover_sources(const std::vector<fs::path>& inputs, report::RunReport& report)
    -> std::vector<fs::path>;

class Pipeline : public SourceProcessor {
public:
    /// `config_file` is re-read by `reload()`; `overrides` are reapplied each time.
    Pipeline(config::GeneratorConfig config, io::OutputWriter& writer, fs::path config_file = {},
             config::ConfigOverrides overrides = {});

    [[nodiscard]] auto process(const fs::path& source) -> report::RunReport override;
    [[nodiscard]] auto remove_outputs(const fs::path& source) -> report::RunReport override;
    [[nodiscard]] auto reload() -> Result<std::vector<fs::path>, config::ConfigError> override;

    /// Generates every discovered source on `config().worker_count()` threads.
    [[nodiscard]] auto run_all() -> report::RunReport;

    /// Generates one in-memory source without touching the disk.
    [[nodiscard]] auto generate_text(const std::string& path, const std::string& text,
                                     report::RunReport& report) -> std::vector<model::EmissionResult>;

    /// Deletes every companion file under the inputs and the output root.
    [[nodiscard]] auto clean() -> report::RunReport;

    [[nodiscard]] auto config() const -> config::GeneratorConfig;

private:
    mutable std::mutex config_mutex_;
    config::GeneratorConfig config_;
    io::OutputWriter& writer_;
    fs::path config_file_;
    config::ConfigOverrides overrides_;

    void remove_stale(const fs::path& companion, report::RunReport& report);
};

} // namespace sfg::pipeline

#endif // SFG_PIPELINE_PIPELINE_HPP
