#include "regen/watcher.hpp"

#include "log/log.hpp"
#include "pipeline/pipeline.hpp"

#include <optional>
#include <system_error>
#include <utility>

namespace sfg::regen {

namespace {

using RawStamp = std::pair<fs::file_time_type, uintmax_t>;

auto stamp_of(const fs::path& path, std::error_code& ec) -> std::optional<RawStamp> {
    auto mtime = fs::last_write_time(path, ec);
    if (ec) {
        return std::nullopt;
    }
    auto size = fs::file_size(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return std::make_pair(mtime, size);
}

} // anonymous namespace

PollingWatcher::PollingWatcher(std::vector<fs::path> inputs, std::vector<fs::path> config_files,
                               std::chrono::milliseconds interval, EventQueue& queue)
    : inputs_(std::move(inputs)), config_files_(std::move(config_files)), interval_(interval),
      queue_(queue) {}

PollingWatcher::~PollingWatcher() {
    stop();
}

auto PollingWatcher::scan_sources() const -> Snapshot {
    Snapshot snapshot;
    auto record = [&](const fs::path& path) {
        std::error_code ec;
        if (auto s = stamp_of(path, ec)) {
            snapshot[path.lexically_normal()] = Stamp{.mtime = s->first, .size = s->second};
        }
    };

    for (const auto& input : inputs_) {
        std::error_code ec;
        if (fs::is_regular_file(input, ec)) {
            if (pipeline::is_source_file(input)) {
                record(input);
            }
            continue;
        }
        if (!fs::is_directory(input, ec)) {
            continue;
        }
        auto options = fs::directory_options::skip_permission_denied;
        for (auto it = fs::recursive_directory_iterator(input, options, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (pipeline::is_source_file(it->path()) && it->is_regular_file(ec)) {
                record(it->path());
            }
        }
        if (ec) {
            SFG_LOG_DEBUG("watch", "Scan of " << input.string() << " stopped: " << ec.message());
        }
    }
    return snapshot;
}

auto PollingWatcher::scan_configs() const -> Snapshot {
    Snapshot snapshot;
    for (const auto& path : config_files_) {
        std::error_code ec;
        if (auto s = stamp_of(path, ec)) {
            snapshot[path] = Stamp{.mtime = s->first, .size = s->second};
        }
    }
    return snapshot;
}

auto PollingWatcher::start() -> Result<bool, WatchError> {
    bool any_input = false;
    for (const auto& input : inputs_) {
        std::error_code ec;
        any_input |= fs::exists(input, ec);
    }
    if (!any_input) {
        return WatchError{.message = "none of the watched inputs exists"};
    }

    sources_ = scan_sources();
    configs_ = scan_configs();
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stopping_ = false;
    }
    thread_ = std::thread(&PollingWatcher::loop, this);
    SFG_LOG_INFO("watch", "Watching " << sources_.size() << " source file(s) every "
                                      << interval_.count() << " ms");
    return true;
}

void PollingWatcher::stop() {
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stopping_ = true;
    }
    stop_cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

auto PollingWatcher::poll_once() -> size_t {
    size_t events = 0;

    auto configs = scan_configs();
    if (configs != configs_) {
        for (const auto& path : config_files_) {
            auto before = configs_.find(path);
            auto after = configs.find(path);
            bool changed = (before == configs_.end()) != (after == configs.end()) ||
                           (before != configs_.end() && !(before->second == after->second));
            if (changed) {
                queue_.push(ChangeEvent{.path = path, .kind = EventKind::ConfigChanged});
                ++events;
            }
        }
        configs_ = std::move(configs);
    }

    auto sources = scan_sources();
    for (const auto& [path, stamp] : sources) {
        auto it = sources_.find(path);
        if (it == sources_.end()) {
            queue_.push(ChangeEvent{.path = path, .kind = EventKind::Created});
            ++events;
        } else if (!(it->second == stamp)) {
            queue_.push(ChangeEvent{.path = path, .kind = EventKind::Modified});
            ++events;
        }
    }
    for (const auto& [path, stamp] : sources_) {
        if (!sources.count(path)) {
            queue_.push(ChangeEvent{.path = path, .kind = EventKind::Deleted});
            ++events;
        }
    }
    sources_ = std::move(sources);

    if (events > 0) {
        SFG_LOG_DEBUG("watch", events << " change(s) detected");
    }
    return events;
}

void PollingWatcher::loop() {
    std::unique_lock<std::mutex> lock(stop_mutex_);
    while (!stopping_) {
        if (stop_cv_.wait_for(lock, interval_, [this] { return stopping_; })) {
            break;
        }
        lock.unlock();
        poll_once();
        lock.lock();
    }
}

} // namespace sfg::regen
