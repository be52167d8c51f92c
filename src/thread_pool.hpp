#ifndef THREAD_POOL_HPP
#define THREAD_POOL_HPP

#include "shared_queue.hpp"
#include "logger.hpp"
#include <vector>
#include <thread>
#include <functional>
#include <atomic>
#include <memory>
#include <algorithm>

using dispatch_task = std::function<void()>;

/**
 * @class thread_pool
 * @brief Fixed set of worker threads, each consuming its own task queue.
 *
 * Tasks are spread round-robin. With a non-zero per-queue capacity, push_task
 * throws queue_full_error instead of letting the backlog grow.
 */
class thread_pool {
public:
    explicit thread_pool(size_t num_threads, size_t queue_capacity = 0)
        : m_num_threads(std::max<size_t>(1, num_threads)) {
        for (size_t i = 0; i < m_num_threads; ++i) {
            m_task_queues.push_back(std::make_shared<shared_queue<dispatch_task>>(queue_capacity));
        }
    }

    ~thread_pool() noexcept {
        try {
            stop();
        } catch (const std::exception& e) {
            util::log::error("Thread pool shutdown failed: {}", e.what());
        }
    }

    thread_pool(const thread_pool&) = delete;
    thread_pool& operator=(const thread_pool&) = delete;

    void start() {
        for (size_t i = 0; i < m_num_threads; ++i) {
            m_threads.emplace_back([this, i] { worker_loop(i); });
        }
        util::log::debug("Thread pool started with {} threads.", m_num_threads);
    }

    // Queued tasks still run; the jthreads join on clear().
    void stop() {
        if (m_stopped.exchange(true)) {
            return;
        }

        for (const auto& queue : m_task_queues) {
            queue->stop();
        }
        m_threads.clear();
        util::log::debug("Thread pool stopped.");
    }

    /// @throws queue_full_error when the selected queue is at capacity.
    void push_task(dispatch_task task) {
        const size_t queue_index = m_next_queue.fetch_add(1, std::memory_order_relaxed) % m_num_threads;
        m_task_queues[queue_index]->push(std::move(task));
    }

    [[nodiscard]] size_t get_total_pending_tasks() const {
        size_t total_tasks = 0;
        for (const auto& queue : m_task_queues) {
            total_tasks += queue->size();
        }
        return total_tasks;
    }

    [[nodiscard]] size_t size() const noexcept {
        return m_num_threads;
    }

private:
    void worker_loop(size_t queue_index) {
        util::log::debug("Worker thread {} started, consuming from queue {}.", std::this_thread::get_id(), queue_index);
        auto& my_queue = *m_task_queues[queue_index];

        while (auto task_opt = my_queue.wait_and_pop()) {
            try {
                if (*task_opt) {
                    (*task_opt)();
                }
            } catch (const std::exception& e) {
                util::log::error("Exception caught in worker thread: {}", e.what());
            }
        }
        util::log::debug("Worker thread {} finished.", std::this_thread::get_id());
    }

    const size_t m_num_threads;
    std::atomic<bool> m_stopped{false};
    std::atomic<size_t> m_next_queue{0};

    std::vector<std::shared_ptr<shared_queue<dispatch_task>>> m_task_queues;
    std::vector<std::jthread> m_threads;
};

#endif // THREAD_POOL_HPP
