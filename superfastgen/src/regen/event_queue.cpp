#include "regen/event_queue.hpp"

#include "log/log.hpp"

namespace sfg::regen {

auto event_kind_name(EventKind kind) -> std::string_view {
    switch (kind) {
    case EventKind::Created:
        return "created";
    case EventKind::Modified:
        return "modified";
    case EventKind::Deleted:
        return "deleted";
    case EventKind::ConfigChanged:
        return "config-changed";
    }
    return "unknown";
}

void EventQueue::push(ChangeEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            SFG_LOG_DEBUG("regen", "Dropping " << event_kind_name(event.kind) << " event for "
                                               << event.path.string() << " after close");
            return;
        }
        events_.push_back(std::move(event));
    }
    cv_.notify_one();
}

auto EventQueue::pop_until(Clock::time_point deadline) -> std::optional<ChangeEvent> {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_until(lock, deadline, [this] { return !events_.empty() || closed_ || woken_; });
    woken_ = false;
    if (events_.empty()) {
        return std::nullopt;
    }
    ChangeEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

void EventQueue::wake() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        woken_ = true;
    }
    cv_.notify_all();
}

void EventQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

auto EventQueue::closed() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

auto EventQueue::size() const -> size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

} // namespace sfg::regen
