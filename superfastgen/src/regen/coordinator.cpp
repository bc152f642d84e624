#include "regen/coordinator.hpp"

#include "crypto/digest.hpp"
#include "io/output_writer.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <exception>
#include <optional>
#include <vector>

namespace sfg::regen {

namespace {

constexpr auto IDLE_RECHECK = std::chrono::seconds(1);

} // anonymous namespace

Coordinator::Coordinator(pipeline::SourceProcessor& processor, EventQueue& queue,
                         CoordinatorOptions options)
    : processor_(processor), queue_(queue), options_(options),
      pool_(std::max<size_t>(options.workers, 1)) {}

auto Coordinator::report() const -> report::RunReport {
    std::lock_guard<std::mutex> lock(mutex_);
    return report_;
}

auto Coordinator::passes() const -> size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return passes_;
}

auto Coordinator::fatal() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return fatal_;
}

// ============================================================================
// Event Loop
// ============================================================================

void Coordinator::run() {
    SFG_LOG_DEBUG("regen", "Coordinator started (debounce " << options_.debounce.count()
                                                            << " ms)");
    while (true) {
        auto ev = queue_.pop_until(next_deadline(Clock::now()));
        auto now = Clock::now();
        if (ev) {
            schedule(*ev, now);
        }
        dispatch_due(now);

        if (!queue_.closed() || queue_.size() > 0) {
            continue;
        }

        // Closed: run what is still scheduled without waiting out the debounce.
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!fatal_) {
                for (auto& [path, state] : paths_) {
                    if (state.scheduled) {
                        state.due = now;
                    }
                }
            }
        }
        dispatch_due(now);
        bool remaining = false;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            done_cv_.wait(lock, [this] { return in_flight_ == 0; });
            remaining = !fatal_ && std::any_of(paths_.begin(), paths_.end(), [](const auto& entry) {
                            return entry.second.scheduled;
                        });
        }
        if (!remaining) {
            break;
        }
    }
    pool_.wait_idle();
    SFG_LOG_DEBUG("regen", "Coordinator stopped after " << passes() << " pass(es)");
}

void Coordinator::schedule(const ChangeEvent& event, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& state = paths_[event.path];
    SFG_LOG_TRACE("regen", event_kind_name(event.kind)
                               << " " << event.path.string()
                               << (state.in_flight ? " (pass running, queued)" : ""));
    state.kind = event.kind;
    state.due = now + options_.debounce;
    state.scheduled = true;
}

auto Coordinator::next_deadline(Clock::time_point now) const -> Clock::time_point {
    std::lock_guard<std::mutex> lock(mutex_);
    Clock::time_point deadline = now + IDLE_RECHECK;
    for (const auto& [path, state] : paths_) {
        if (state.scheduled && !state.in_flight) {
            deadline = std::min(deadline, state.due);
        }
    }
    return deadline;
}

void Coordinator::dispatch_due(Clock::time_point now) {
    std::vector<std::pair<fs::path, EventKind>> ready;
    bool config_changed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = paths_.begin(); it != paths_.end();) {
            auto& state = it->second;
            if (!state.scheduled || state.in_flight || state.due > now) {
                ++it;
                continue;
            }
            state.scheduled = false;
            if (state.kind == EventKind::ConfigChanged) {
                config_changed = true;
                it = paths_.erase(it);
                continue;
            }
            state.in_flight = true;
            ++in_flight_;
            ready.emplace_back(it->first, state.kind);
            ++it;
        }
    }

    if (config_changed) {
        reconfigure(now);
    }
    for (auto& [path, kind] : ready) {
        pool_.submit([this, path, kind] { execute(path, kind); });
    }
}

void Coordinator::reconfigure(Clock::time_point now) {
    SFG_LOG_INFO("regen", "Configuration changed, regenerating everything");
    auto sources = processor_.reload();

    std::lock_guard<std::mutex> lock(mutex_);
    fingerprints_.clear();
    if (is_err(sources)) {
        const auto& e = unwrap_err(sources);
        report_.add(report::Diagnostic{.kind = report::DiagnosticKind::Config,
                                       .path = e.path,
                                       .declaration = "",
                                       .message = e.message,
                                       .line = e.line,
                                       .column = 0});
        SFG_LOG_ERROR("regen", "Configuration reload failed: " << e.path << ": " << e.message);
        fatal_ = true;
        queue_.close();
        return;
    }
    for (const auto& source : unwrap(sources)) {
        auto& state = paths_[source];
        state.kind = EventKind::Modified;
        state.due = now;
        state.scheduled = true;
    }
}

// ============================================================================
// Passes
// ============================================================================

void Coordinator::execute(const fs::path& path, EventKind kind) {
    // Releases the path even when the pass throws, so later events still dispatch
    // and run() can drain.
    struct FinishGuard {
        Coordinator& self;
        const fs::path& path;
        ~FinishGuard() { self.finish(path); }
    } guard{*this, path};

    std::string key = path.lexically_normal().generic_string();
    report::RunReport pass_report;
    bool counted = false;
    try {
        counted = run_pass(path, key, kind, pass_report);
    } catch (const std::exception& e) {
        SFG_LOG_ERROR("regen", "Pass failed for " << key << ": " << e.what());
        pass_report = report::RunReport{};
        counted = kind != EventKind::Deleted;
        pass_report.files_processed = counted ? 1 : 0;
        pass_report.add(report::Diagnostic{.kind = counted ? report::DiagnosticKind::Emit
                                                           : report::DiagnosticKind::Write,
                                           .path = key,
                                           .declaration = "",
                                           .message = std::string("pass failed: ") + e.what(),
                                           .line = 0,
                                           .column = 0});
        std::lock_guard<std::mutex> lock(mutex_);
        fingerprints_.erase(key);
    }

    if (pass_report.files_written > 0 || pass_report.files_removed > 0) {
        SFG_LOG_INFO("regen", path.string() << ": " << pass_report.files_written << " written, "
                                            << pass_report.files_removed << " removed");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    report_.merge(pass_report);
    if (counted) {
        ++passes_;
    }
}

auto Coordinator::run_pass(const fs::path& path, const std::string& key, EventKind kind,
                           report::RunReport& pass_report) -> bool {
    if (kind == EventKind::Deleted) {
        SFG_LOG_INFO("regen", "Source deleted: " << key);
        pass_report = processor_.remove_outputs(path);
        std::lock_guard<std::mutex> lock(mutex_);
        fingerprints_.erase(key);
        return false;
    }

    std::optional<std::string> fingerprint;
    if (auto text = io::read_file(path)) {
        auto digest = crypto::sha1_hex(*text);
        if (is_ok(digest)) {
            fingerprint = std::move(unwrap(digest));
        }
    }

    if (fingerprint) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = fingerprints_.find(key);
        if (it != fingerprints_.end() && it->second == *fingerprint) {
            SFG_LOG_DEBUG("regen", "Unchanged content, skipping " << key);
            return false;
        }
    }

    pass_report = processor_.process(path);
    std::lock_guard<std::mutex> lock(mutex_);
    if (fingerprint && !pass_report.has_errors()) {
        fingerprints_[key] = *fingerprint;
    } else {
        fingerprints_.erase(key);
    }
    return true;
}

void Coordinator::finish(const fs::path& path) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = paths_.find(path);
        if (it != paths_.end()) {
            it->second.in_flight = false;
            if (!it->second.scheduled) {
                paths_.erase(it);
            }
        }
        --in_flight_;
    }
    done_cv_.notify_all();
    queue_.wake();
}

} // namespace sfg::regen
