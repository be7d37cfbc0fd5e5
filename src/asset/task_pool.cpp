/// @file task_pool.cpp
/// @brief AsyncTaskPool implementation

#include <arbor/asset/task_pool.hpp>

namespace arbor_asset {

AsyncTaskPool::AsyncTaskPool(std::size_t num_threads) {
    if (num_threads == 0) {
        num_threads = 1;
    }
    for (std::size_t i = 0; i < num_threads; ++i) {
        m_threads.emplace_back(&AsyncTaskPool::worker_thread, this);
    }
}

AsyncTaskPool::~AsyncTaskPool() {
    {
        std::lock_guard lock(m_mutex);
        m_stop = true;
    }
    m_condition.notify_all();

    for (auto& thread : m_threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

void AsyncTaskPool::submit(Task task) {
    {
        std::lock_guard lock(m_mutex);
        m_tasks.push_back(std::move(task));
        ++m_pending;
    }
    m_condition.notify_one();
}

std::size_t AsyncTaskPool::pending_count() const {
    std::lock_guard lock(m_mutex);
    return m_pending;
}

void AsyncTaskPool::wait_all() {
    std::unique_lock lock(m_mutex);
    m_done_condition.wait(lock, [this] {
        return m_pending == 0;
    });
}

void AsyncTaskPool::worker_thread() {
    while (true) {
        Task task;
        {
            std::unique_lock lock(m_mutex);
            m_condition.wait(lock, [this] {
                return m_stop || !m_tasks.empty();
            });

            if (m_stop && m_tasks.empty()) {
                return;
            }

            task = std::move(m_tasks.front());
            m_tasks.pop_front();
        }

        task();

        {
            std::lock_guard lock(m_mutex);
            --m_pending;
        }
        m_done_condition.notify_all();
    }
}

} // namespace arbor_asset
