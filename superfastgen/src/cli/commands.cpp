//! # CLI Commands
//!
//! `generate`, `clean` and `watch`. Each loads the configuration, applies
//! the command-line overrides, runs, prints the summary and optionally
//! writes the JSON report.

#include "cli/cli.hpp"

#include "io/output_writer.hpp"
#include "log/log.hpp"
#include "pipeline/pipeline.hpp"
#include "regen/coordinator.hpp"
#include "regen/event_queue.hpp"
#include "regen/watcher.hpp"

#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <thread>

namespace sfg::cli {

namespace {

constexpr std::string_view PUBSPEC_FILE_NAME = "pubspec.yaml";

volatile std::sig_atomic_t g_interrupted = 0;

void on_interrupt(int /*signal*/) {
    g_interrupted = 1;
}

auto config_file_of(const CliOptions& options) -> fs::path {
    return options.config_path ? *options.config_path : fs::path(config::CONFIG_FILE_NAME);
}

auto load_effective_config(const CliOptions& options)
    -> Result<config::GeneratorConfig, config::ConfigError> {
    auto loaded = config::load_config(config_file_of(options), options.config_path.has_value());
    if (is_err(loaded)) {
        return loaded;
    }
    config::apply_overrides(unwrap(loaded), options.overrides);
    return loaded;
}

void print_config_error(const config::ConfigError& e) {
    std::cerr << "error: " << e.path;
    if (e.line > 0) {
        std::cerr << ":" << e.line;
    }
    std::cerr << ": " << e.message << "\n";
}

/// Writes the JSON report when `--report` was given. False when it could not.
auto write_report(const CliOptions& options, const report::RunReport& report) -> bool {
    if (!options.report_path) {
        return true;
    }
    std::ofstream out(*options.report_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        SFG_LOG_ERROR("cli", "Cannot write report to " << options.report_path->string());
        std::cerr << "error: cannot write report to " << options.report_path->string() << "\n";
        return false;
    }
    report.write_json(out);
    SFG_LOG_DEBUG("cli", "Report written to " << options.report_path->string());
    return true;
}

auto finish(const CliOptions& options, const report::RunReport& report) -> int {
    report.write_summary(std::cout);
    bool reported = write_report(options, report);
    return (report.fatal || !reported) ? 1 : 0;
}

} // anonymous namespace

// ============================================================================
// generate / all
// ============================================================================

auto run_generate(const CliOptions& options) -> int {
    auto loaded = load_effective_config(options);
    if (is_err(loaded)) {
        print_config_error(unwrap_err(loaded));
        return 1;
    }
    const auto& config = unwrap(loaded);

    io::OutputWriter writer;
    pipeline::Pipeline pipeline(config, writer);

    auto start = std::chrono::steady_clock::now();
    auto report = pipeline.run_all();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    SFG_LOG_INFO("cli", "Processed " << report.files_processed << " file(s) in " << elapsed.count()
                                     << " ms");
    return finish(options, report);
}

// ============================================================================
// clean
// ============================================================================

auto run_clean(const CliOptions& options) -> int {
    auto loaded = load_effective_config(options);
    if (is_err(loaded)) {
        print_config_error(unwrap_err(loaded));
        return 1;
    }

    io::OutputWriter writer;
    pipeline::Pipeline pipeline(unwrap(loaded), writer);
    auto report = pipeline.clean();
    std::cout << "Removed " << report.files_removed << " generated file(s)\n";
    bool reported = write_report(options, report);
    return reported ? 0 : 1;
}

// ============================================================================
// watch
// ============================================================================

auto run_watch(const CliOptions& options) -> int {
    auto loaded = load_effective_config(options);
    if (is_err(loaded)) {
        print_config_error(unwrap_err(loaded));
        return 1;
    }
    const auto config = unwrap(loaded);
    auto config_file = config_file_of(options);

    io::OutputWriter writer;
    pipeline::Pipeline pipeline(config, writer, config_file, options.overrides);

    report::RunReport report = pipeline.run_all();
    report.write_summary(std::cout);

    regen::EventQueue queue;
    regen::PollingWatcher watcher(config.input_paths,
                                  {config_file, fs::path(PUBSPEC_FILE_NAME)},
                                  config.poll_interval, queue);
    auto started = watcher.start();
    if (is_err(started)) {
        const auto& e = unwrap_err(started);
        report.add(report::Diagnostic{.kind = report::DiagnosticKind::Watch,
                                      .path = "",
                                      .declaration = "",
                                      .message = e.message,
                                      .line = 0,
                                      .column = 0});
        std::cerr << "error: cannot watch: " << e.message << "\n";
        write_report(options, report);
        return 1;
    }

    g_interrupted = 0;
    auto previous_int = std::signal(SIGINT, on_interrupt);
    auto previous_term = std::signal(SIGTERM, on_interrupt);

    // Closes the queue on Ctrl-C. The coordinator closes it itself on a fatal
    // configuration error.
    std::thread stopper([&queue] {
        while (g_interrupted == 0 && !queue.closed()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        queue.close();
    });

    std::cout << "Watching for changes. Press Ctrl-C to stop.\n";
    regen::Coordinator coordinator(pipeline, queue,
                                   regen::CoordinatorOptions{.debounce = config.debounce,
                                                             .workers = config.worker_count()});
    coordinator.run();

    watcher.stop();
    queue.close();
    stopper.join();
    std::signal(SIGINT, previous_int);
    std::signal(SIGTERM, previous_term);

    report.merge(coordinator.report());
    SFG_LOG_INFO("cli", "Watch stopped after " << coordinator.passes() << " regeneration pass(es)");
    return finish(options, report);
}

} // namespace sfg::cli
