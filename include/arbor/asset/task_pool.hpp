#pragma once

/// @file task_pool.hpp
/// @brief Fixed-size worker pool for background decoding

#include "fwd.hpp"

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace arbor_asset {

/// Thread pool running tasks in submission order
class AsyncTaskPool {
public:
    using Task = std::function<void()>;

    /// Create thread pool with specified number of threads
    explicit AsyncTaskPool(std::size_t num_threads = 2);

    /// Destructor - runs the remaining queue, then joins
    ~AsyncTaskPool();

    // Non-copyable, non-movable
    AsyncTaskPool(const AsyncTaskPool&) = delete;
    AsyncTaskPool& operator=(const AsyncTaskPool&) = delete;

    /// Submit a task for execution
    void submit(Task task);

    /// Tasks queued or running
    [[nodiscard]] std::size_t pending_count() const;

    [[nodiscard]] std::size_t thread_count() const { return m_threads.size(); }

    /// Wait for all tasks to complete
    void wait_all();

private:
    void worker_thread();

    std::vector<std::thread> m_threads;
    std::deque<Task> m_tasks;
    mutable std::mutex m_mutex;
    std::condition_variable m_condition;
    std::condition_variable m_done_condition;
    bool m_stop = false;
    std::size_t m_pending = 0;
};

} // namespace arbor_asset
