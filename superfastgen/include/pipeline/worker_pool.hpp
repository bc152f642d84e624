//! # Worker Pool
//!
//! A fixed set of threads draining a shared task queue. Used by batch runs
//! (one task per source file) and by the regeneration coordinator.
//!
//! | Member | Synchronization |
//! |--------|-----------------|
//! | task queue | mutex + condition variable |
//! | idle tracking | `active_` counter + `idle_cv_` |
//!
//! No ordering is guaranteed between tasks. The destructor finishes queued
//! tasks before joining.

#ifndef SFG_PIPELINE_WORKER_POOL_HPP
#define SFG_PIPELINE_WORKER_POOL_HPP

#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace sfg::pipeline {

class WorkerPool {
public:
    explicit WorkerPool(size_t threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    auto operator=(const WorkerPool&) -> WorkerPool& = delete;

    void submit(std::function<void()> task);

    /// Blocks until the queue is empty and no task is running.
    void wait_idle();

    [[nodiscard]] auto size() const -> size_t {
        return threads_.size();
    }

private:
    std::queue<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    size_t active_ = 0;
    bool stop_ = false;
    std::vector<std::thread> threads_;

    void worker_loop();
};

} // namespace sfg::pipeline

#endif // SFG_PIPELINE_WORKER_POOL_HPP
