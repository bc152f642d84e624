//! # Polling Watcher
//!
//! Detects source and configuration changes by comparing directory
//! snapshots (modification time and size) every `interval`.
//!
//! | Change | Event |
//! |--------|-------|
//! | new `*.dart` source | `created` |
//! | source with a new mtime or size | `modified` |
//! | source gone | `deleted` |
//! | `superfastgen.yaml` / `pubspec.yaml` changed, created or removed | `config-changed` |
//!
//! Companion files (`*.g.dart`, `*.freezed.dart`, `*.config.dart`) are
//! never reported, so the generator's own writes do not retrigger it.

#ifndef SFG_REGEN_WATCHER_HPP
#define SFG_REGEN_WATCHER_HPP

#include "common.hpp"
#include "regen/event_queue.hpp"

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace sfg::regen {

struct WatchError {
    std::string message;
};

class PollingWatcher {
public:
    PollingWatcher(std::vector<fs::path> inputs, std::vector<fs::path> config_files,
                   std::chrono::milliseconds interval, EventQueue& queue);
    ~PollingWatcher();

    PollingWatcher(const PollingWatcher&) = delete;
    auto operator=(const PollingWatcher&) -> PollingWatcher& = delete;

    /// Takes the initial snapshot and starts the polling thread. Fails when
    /// none of the inputs exists.
    [[nodiscard]] auto start() -> Result<bool, WatchError>;

    void stop();

    /// Scans once and pushes an event per difference. Returns the event count.
    auto poll_once() -> size_t;

private:
    struct Stamp {
        std::filesystem::file_time_type mtime;
        uintmax_t size = 0;

        [[nodiscard]] auto operator==(const Stamp& other) const -> bool = default;
    };
    using Snapshot = std::map<fs::path, Stamp>;

    std::vector<fs::path> inputs_;
    std::vector<fs::path> config_files_;
    std::chrono::milliseconds interval_;
    EventQueue& queue_;

    Snapshot sources_;
    Snapshot configs_;

    std::thread thread_;
    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
    bool stopping_ = false;

    [[nodiscard]] auto scan_sources() const -> Snapshot;
    [[nodiscard]] auto scan_configs() const -> Snapshot;
    void loop();
};

} // namespace sfg::regen

#endif // SFG_REGEN_WATCHER_HPP
