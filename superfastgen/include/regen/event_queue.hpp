//! # Change Events
//!
//! The queue between the filesystem watcher and the regeneration
//! coordinator. Producers `push()`; the coordinator blocks in
//! `pop_until()` with its next debounce deadline.

#ifndef SFG_REGEN_EVENT_QUEUE_HPP
#define SFG_REGEN_EVENT_QUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string_view>

namespace sfg::regen {

namespace fs = std::filesystem;
using Clock = std::chrono::steady_clock;

enum class EventKind { Created, Modified, Deleted, ConfigChanged };

[[nodiscard]] auto event_kind_name(EventKind kind) -> std::string_view;

struct ChangeEvent {
    fs::path path;
    EventKind kind = EventKind::Modified;
};

class EventQueue {
public:
    void push(ChangeEvent event);

    /// Next event, or `nullopt` once `deadline` passes, `wake()` is called,
    /// or the queue is closed and empty.
    [[nodiscard]] auto pop_until(Clock::time_point deadline) -> std::optional<ChangeEvent>;

    /// Interrupts a pending `pop_until()`.
    void wake();

    /// Rejects further pushes. Queued events are still delivered.
    void close();

    [[nodiscard]] auto closed() const -> bool;
    [[nodiscard]] auto size() const -> size_t;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<ChangeEvent> events_;
    bool closed_ = false;
    bool woken_ = false;
};

} // namespace sfg::regen

#endif // SFG_REGEN_EVENT_QUEUE_HPP
