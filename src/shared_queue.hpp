#ifndef SHARED_QUEUE_HPP
#define SHARED_QUEUE_HPP

#include <queue>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <vector>
#include <stdexcept>

/// @brief Thrown by shared_queue::push when a bounded queue is full.
class queue_full_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @class shared_queue
 * @brief A mutex-protected FIFO used between I/O threads and worker threads.
 */
template<typename T>
class shared_queue {
public:
    /**
     * @param capacity The maximum number of queued items; 0 means unbounded.
     */
    explicit shared_queue(size_t capacity = 0) : m_capacity(capacity) {}

    /**
     * @brief Pushes a new item onto the queue and notifies a waiting thread.
     * @throws queue_full_error if the queue has reached its capacity.
     */
    void push(T item) {
        {
            std::scoped_lock lock(m_mutex);
            if (m_capacity > 0 && m_queue.size() >= m_capacity) {
                throw queue_full_error("Queue is full");
            }
            m_queue.push(std::move(item));
        }
        m_cond.notify_one();
    }

    /**
     * @brief Waits for an item and pops it.
     * @return The item, or std::nullopt once the queue is stopped and drained.
     */
    std::optional<T> wait_and_pop() {
        std::unique_lock lock(m_mutex);
        m_cond.wait(lock, [this] { return !m_queue.empty() || m_stopped; });

        if (m_queue.empty()) {
            return std::nullopt;
        }

        T item = std::move(m_queue.front());
        m_queue.pop();
        return item;
    }

    /// @brief Moves all queued items into a target vector without blocking.
    void drain_to(std::vector<T>& target) {
        std::scoped_lock lock(m_mutex);
        while (!m_queue.empty()) {
            target.push_back(std::move(m_queue.front()));
            m_queue.pop();
        }
    }

    /// @brief Wakes all waiting threads; they drain what is left, then stop.
    void stop() {
        {
            std::scoped_lock lock(m_mutex);
            m_stopped = true;
        }
        m_cond.notify_all();
    }

    [[nodiscard]] size_t size() const {
        std::scoped_lock lock(m_mutex);
        return m_queue.size();
    }

private:
    std::queue<T> m_queue;
    mutable std::mutex m_mutex;
    std::condition_variable m_cond;
    bool m_stopped{false};
    const size_t m_capacity;
};

#endif // SHARED_QUEUE_HPP
