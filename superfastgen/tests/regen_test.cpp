#include "regen/coordinator.hpp"
#include "regen/event_queue.hpp"
#include "regen/watcher.hpp"
#include "test_util.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace sfg;
using namespace sfg::regen;
using namespace std::chrono_literals;

namespace {

/// Records every call; optionally holds the first `process()` open.
class FakeProcessor : public pipeline::SourceProcessor {
public:
    std::chrono::milliseconds hold{0};
    std::vector<fs::path> reload_sources;
    bool reload_fails = false;
    bool process_throws = false;

    auto process(const fs::path& source) -> report::RunReport override {
        int running = concurrent_.fetch_add(1) + 1;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++processed_[source];
            max_concurrent_ = std::max(max_concurrent_, running);
        }
        if (hold.count() > 0) {
            std::this_thread::sleep_for(hold);
        }
        concurrent_.fetch_sub(1);
        if (process_throws) {
            throw std::runtime_error("emitter crashed");
        }
        report::RunReport report;
        report.files_processed = 1;
        report.files_written = 1;
        return report;
    }

    auto remove_outputs(const fs::path& source) -> report::RunReport override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++removed_[source];
        report::RunReport report;
        report.files_removed = 2;
        return report;
    }

    auto reload() -> Result<std::vector<fs::path>, config::ConfigError> override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++reloads_;
        if (reload_fails) {
            return config::ConfigError{
                .path = "superfastgen.yaml", .message = "expected a boolean", .line = 3};
        }
        return reload_sources;
    }

    auto processed(const fs::path& source) const -> int {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = processed_.find(source);
        return it == processed_.end() ? 0 : it->second;
    }

    auto removed(const fs::path& source) const -> int {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = removed_.find(source);
        return it == removed_.end() ? 0 : it->second;
    }

    auto reloads() const -> int {
        std::lock_guard<std::mutex> lock(mutex_);
        return reloads_;
    }

    auto max_concurrent() const -> int {
        std::lock_guard<std::mutex> lock(mutex_);
        return max_concurrent_;
    }

private:
    mutable std::mutex mutex_;
    std::map<fs::path, int> processed_;
    std::map<fs::path, int> removed_;
    int reloads_ = 0;
    int max_concurrent_ = 0;
    std::atomic<int> concurrent_{0};
};

} // anonymous namespace

// ============================================================================
// EventQueue
// ============================================================================

TEST(EventQueueTest, DeadlinePassesWithoutEvents) {
    EventQueue queue;
    auto start = Clock::now();
    EXPECT_FALSE(queue.pop_until(start + 20ms).has_value());
    EXPECT_GE(Clock::now() - start, 20ms);
}

TEST(EventQueueTest, CloseKeepsQueuedEvents) {
    EventQueue queue;
    queue.push(ChangeEvent{.path = "a.dart", .kind = EventKind::Created});
    queue.close();
    queue.push(ChangeEvent{.path = "b.dart", .kind = EventKind::Created});
    EXPECT_TRUE(queue.closed());
    EXPECT_EQ(queue.size(), 1u);

    auto ev = queue.pop_until(Clock::now() + 1s);
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->path, fs::path("a.dart"));
    EXPECT_FALSE(queue.pop_until(Clock::now() + 1s).has_value());
}

TEST(EventQueueTest, WakeInterruptsWait) {
    EventQueue queue;
    std::thread waker([&queue] {
        std::this_thread::sleep_for(20ms);
        queue.wake();
    });
    auto start = Clock::now();
    EXPECT_FALSE(queue.pop_until(start + 10s).has_value());
    EXPECT_LT(Clock::now() - start, 5s);
    waker.join();
}

TEST(EventQueueTest, KindNames) {
    EXPECT_EQ(event_kind_name(EventKind::Created), "created");
    EXPECT_EQ(event_kind_name(EventKind::ConfigChanged), "config-changed");
}

// ============================================================================
// Coordinator
// ============================================================================

class CoordinatorTest : public ::testing::Test {
protected:
    FakeProcessor processor_;
    EventQueue queue_;

    auto options(size_t workers = 2) -> CoordinatorOptions {
        return CoordinatorOptions{.debounce = 30ms, .workers = workers};
    }

    void push(const fs::path& path, EventKind kind = EventKind::Modified) {
        queue_.push(ChangeEvent{.path = path, .kind = kind});
    }
};

TEST_F(CoordinatorTest, BurstCollapsesIntoOnePass) {
    for (int i = 0; i < 5; ++i) {
        push("lib/a.dart");
    }
    queue_.close();
    Coordinator coordinator(processor_, queue_, options());
    coordinator.run();

    EXPECT_EQ(processor_.processed("lib/a.dart"), 1);
    EXPECT_EQ(coordinator.passes(), 1u);
    EXPECT_EQ(coordinator.report().files_written, 1u);
}

TEST_F(CoordinatorTest, DistinctPathsEachGetAPass) {
    push("lib/a.dart", EventKind::Created);
    push("lib/b.dart");
    push("lib/a.dart");
    queue_.close();
    Coordinator coordinator(processor_, queue_, options());
    coordinator.run();

    EXPECT_EQ(processor_.processed("lib/a.dart"), 1);
    EXPECT_EQ(processor_.processed("lib/b.dart"), 1);
    EXPECT_EQ(coordinator.report().files_processed, 2u);
}

TEST_F(CoordinatorTest, DeletionRemovesOutputs) {
    push("lib/gone.dart", EventKind::Deleted);
    queue_.close();
    Coordinator coordinator(processor_, queue_, options());
    coordinator.run();

    EXPECT_EQ(processor_.removed("lib/gone.dart"), 1);
    EXPECT_EQ(processor_.processed("lib/gone.dart"), 0);
    EXPECT_EQ(coordinator.passes(), 0u);
    EXPECT_EQ(coordinator.report().files_removed, 2u);
}

TEST_F(CoordinatorTest, ThrowingPassReleasesPath) {
    processor_.process_throws = true;
    Coordinator coordinator(processor_, queue_, options());
    std::thread loop([&coordinator] { coordinator.run(); });

    push("lib/bad.dart");
    ASSERT_TRUE(test::wait_for([&] { return processor_.processed("lib/bad.dart") == 1; }));
    ASSERT_TRUE(test::wait_for([&] { return coordinator.report().errors.size() == 1; }));
    push("lib/bad.dart");
    ASSERT_TRUE(test::wait_for([&] { return processor_.processed("lib/bad.dart") == 2; }));
    queue_.close();
    loop.join();

    auto summary = coordinator.report();
    EXPECT_EQ(coordinator.passes(), 2u);
    EXPECT_EQ(summary.files_processed, 2u);
    ASSERT_EQ(summary.errors.size(), 2u);
    EXPECT_EQ(summary.errors[0].kind, report::DiagnosticKind::Emit);
    EXPECT_EQ(summary.errors[0].path, "lib/bad.dart");
    EXPECT_NE(summary.errors[0].message.find("emitter crashed"), std::string::npos);
    EXPECT_FALSE(coordinator.fatal());
}

TEST_F(CoordinatorTest, EventDuringPassSchedulesOneRerun) {
    processor_.hold = 150ms;
    Coordinator coordinator(processor_, queue_, options(4));
    std::thread loop([&coordinator] { coordinator.run(); });

    push("lib/slow.dart");
    ASSERT_TRUE(test::wait_for([&] { return processor_.processed("lib/slow.dart") == 1; }));
    push("lib/slow.dart");
    push("lib/slow.dart");
    queue_.close();
    loop.join();

    EXPECT_EQ(processor_.processed("lib/slow.dart"), 2);
    EXPECT_EQ(processor_.max_concurrent(), 1);
}

TEST_F(CoordinatorTest, UnchangedContentIsSkipped) {
    test::TempDir dir;
    auto path = dir / "lib/a.dart";
    test::write_text(path, test::USER_SOURCE);

    Coordinator coordinator(processor_, queue_, options());
    std::thread loop([&coordinator] { coordinator.run(); });
    push(path);
    ASSERT_TRUE(test::wait_for([&] { return coordinator.passes() == 1; }));
    push(path);
    queue_.close();
    loop.join();

    EXPECT_EQ(processor_.processed(path), 1);
    EXPECT_EQ(coordinator.passes(), 1u);
}

TEST_F(CoordinatorTest, ChangedContentIsProcessedAgain) {
    test::TempDir dir;
    auto path = dir / "lib/a.dart";
    test::write_text(path, test::USER_SOURCE);

    Coordinator coordinator(processor_, queue_, options());
    std::thread loop([&coordinator] { coordinator.run(); });
    push(path);
    ASSERT_TRUE(test::wait_for([&] { return coordinator.passes() == 1; }));
    test::write_text(path, std::string(test::USER_SOURCE) + "\n// edited\n");
    push(path);
    queue_.close();
    loop.join();

    EXPECT_EQ(processor_.processed(path), 2);
}

TEST_F(CoordinatorTest, ConfigChangeRegeneratesEverySource) {
    processor_.reload_sources = {"lib/a.dart", "lib/b.dart"};
    push("superfastgen.yaml", EventKind::ConfigChanged);
    queue_.close();
    Coordinator coordinator(processor_, queue_, options());
    coordinator.run();

    EXPECT_EQ(processor_.reloads(), 1);
    EXPECT_EQ(processor_.processed("lib/a.dart"), 1);
    EXPECT_EQ(processor_.processed("lib/b.dart"), 1);
    EXPECT_FALSE(coordinator.fatal());
}

TEST_F(CoordinatorTest, ConfigReloadFailureIsFatal) {
    processor_.reload_fails = true;
    Coordinator coordinator(processor_, queue_, options());
    std::thread loop([&coordinator] { coordinator.run(); });
    push("superfastgen.yaml", EventKind::ConfigChanged);
    loop.join();

    EXPECT_TRUE(coordinator.fatal());
    EXPECT_TRUE(queue_.closed());
    auto summary = coordinator.report();
    EXPECT_TRUE(summary.fatal);
    ASSERT_EQ(summary.errors.size(), 1u);
    EXPECT_EQ(summary.errors[0].kind, report::DiagnosticKind::Config);
    EXPECT_EQ(summary.errors[0].line, 3u);
}

// ============================================================================
// PollingWatcher
// ============================================================================

class WatcherTest : public ::testing::Test {
protected:
    test::TempDir dir_;
    EventQueue queue_;

    auto drain() -> std::vector<ChangeEvent> {
        std::vector<ChangeEvent> events;
        while (queue_.size() > 0) {
            if (auto ev = queue_.pop_until(Clock::now())) {
                events.push_back(std::move(*ev));
            }
        }
        return events;
    }
};

TEST_F(WatcherTest, StartFailsWithoutInputs) {
    PollingWatcher w({dir_ / "missing"}, {}, 20ms, queue_);
    auto started = w.start();
    ASSERT_TRUE(is_err(started));
    EXPECT_NE(unwrap_err(started).message.find("none of the watched inputs"), std::string::npos);
}

TEST_F(WatcherTest, DetectsSourceChanges) {
    test::write_text(dir_ / "lib/a.dart", "class A {}\n");
    test::write_text(dir_ / "lib/a.g.dart", "// generated\n");
    PollingWatcher w({dir_ / "lib"}, {dir_ / "superfastgen.yaml"}, 20ms, queue_);

    EXPECT_EQ(w.poll_once(), 1u);
    auto initial = drain();
    ASSERT_EQ(initial.size(), 1u);
    EXPECT_EQ(initial[0].kind, EventKind::Created);
    EXPECT_EQ(initial[0].path.filename(), "a.dart");

    test::write_text(dir_ / "lib/a.dart", "class A { int x = 1; }\n");
    test::write_text(dir_ / "lib/a.g.dart", "// generated again, longer\n");
    test::write_text(dir_ / "lib/b.dart", "class B {}\n");
    EXPECT_EQ(w.poll_once(), 2u);
    auto changes = drain();
    ASSERT_EQ(changes.size(), 2u);
    EXPECT_EQ(changes[0].kind, EventKind::Modified);
    EXPECT_EQ(changes[0].path.filename(), "a.dart");
    EXPECT_EQ(changes[1].kind, EventKind::Created);
    EXPECT_EQ(changes[1].path.filename(), "b.dart");

    fs::remove(dir_ / "lib/b.dart");
    EXPECT_EQ(w.poll_once(), 1u);
    auto deleted = drain();
    ASSERT_EQ(deleted.size(), 1u);
    EXPECT_EQ(deleted[0].kind, EventKind::Deleted);

    EXPECT_EQ(w.poll_once(), 0u);
}

TEST_F(WatcherTest, DetectsConfigChanges) {
    fs::create_directories(dir_ / "lib");
    PollingWatcher w({dir_ / "lib"}, {dir_ / "superfastgen.yaml"}, 20ms, queue_);
    EXPECT_EQ(w.poll_once(), 0u);

    test::write_text(dir_ / "superfastgen.yaml", "generate:\n  input: lib\n");
    EXPECT_EQ(w.poll_once(), 1u);
    auto events = drain();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind, EventKind::ConfigChanged);
    EXPECT_EQ(events[0].path, dir_ / "superfastgen.yaml");

    fs::remove(dir_ / "superfastgen.yaml");
    EXPECT_EQ(w.poll_once(), 1u);
    EXPECT_EQ(drain()[0].kind, EventKind::ConfigChanged);
}

TEST_F(WatcherTest, BackgroundPolling) {
    test::write_text(dir_ / "lib/a.dart", "class A {}\n");
    PollingWatcher w({dir_ / "lib"}, {}, 20ms, queue_);
    ASSERT_TRUE(is_ok(w.start()));
    EXPECT_EQ(queue_.size(), 0u);

    test::write_text(dir_ / "lib/c.dart", "class C {}\n");
    EXPECT_TRUE(test::wait_for([&] { return queue_.size() > 0; }));
    w.stop();

    auto events = drain();
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events[0].kind, EventKind::Created);
    EXPECT_EQ(events[0].path.filename(), "c.dart");
}
