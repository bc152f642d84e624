//! # Regeneration Coordinator
//!
//! Turns a stream of change events into the minimal set of pipeline passes.
//!
//! ## Per-Path States
//!
//! ```text
//!             event                 deadline            pass done
//! (absent) ─────────→ debouncing ─────────────→ running ───────────→ (absent)
//!                      ↑    │ event: restart timer  │ event
//!                      └────┘                       ↓
//!                                             running + rerun ──→ debouncing
//! ```
//!
//! - Events for a path inside the debounce window collapse into one pass.
//! - A path never has two passes running. An event observed while a pass
//!   runs schedules exactly one further pass once it finishes.
//! - `config-changed` drops every cached fingerprint, reloads the
//!   configuration and schedules every source.
//! - `deleted` removes the path's companions.
//!
//! Unchanged sources are recognized by the SHA-1 of their text and skipped.

#ifndef SFG_REGEN_COORDINATOR_HPP
#define SFG_REGEN_COORDINATOR_HPP

#include "pipeline/pipeline.hpp"
#include "pipeline/worker_pool.hpp"
#include "regen/event_queue.hpp"
#include "report/run_report.hpp"

#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

namespace sfg::regen {

struct CoordinatorOptions {
    std::chrono::milliseconds debounce{150};
    size_t workers = 1;
};

class Coordinator {
public:
    Coordinator(pipeline::SourceProcessor& processor, EventQueue& queue,
                CoordinatorOptions options);

    /// Consumes events until the queue is closed, then finishes every
    /// scheduled pass and returns.
    void run();

    /// Accumulated report of every pass so far.
    [[nodiscard]] auto report() const -> report::RunReport;

    /// Pipeline passes executed (deletions and skipped unchanged files excluded).
    [[nodiscard]] auto passes() const -> size_t;

    /// True once configuration reload failed; `run()` then returns.
    [[nodiscard]] auto fatal() const -> bool;

private:
    struct PathState {
        EventKind kind = EventKind::Modified;
        Clock::time_point due;
        bool scheduled = false; ///< waiting for `due`
        bool in_flight = false;
    };

    pipeline::SourceProcessor& processor_;
    EventQueue& queue_;
    CoordinatorOptions options_;

    mutable std::mutex mutex_;
    std::condition_variable done_cv_;
    std::map<fs::path, PathState> paths_;
    std::unordered_map<std::string, std::string> fingerprints_;
    report::RunReport report_;
    size_t passes_ = 0;
    size_t in_flight_ = 0;
    bool fatal_ = false;

    pipeline::WorkerPool pool_;

    void schedule(const ChangeEvent& event, Clock::time_point now);
    [[nodiscard]] auto next_deadline(Clock::time_point now) const -> Clock::time_point;
    void dispatch_due(Clock::time_point now);
    void reconfigure(Clock::time_point now);

    void execute(const fs::path& path, EventKind kind);
    /// Runs one pass into `pass_report`; returns true when the pipeline ran.
    auto run_pass(const fs::path& path, const std::string& key, EventKind kind,
                  report::RunReport& pass_report) -> bool;
    void finish(const fs::path& path);
};

} // namespace sfg::regen

#endif // SFG_REGEN_COORDINATOR_HPP
