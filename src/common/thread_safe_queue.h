#ifndef CALCPILOT_THREAD_SAFE_QUEUE_H
#define CALCPILOT_THREAD_SAFE_QUEUE_H

#include <queue>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <chrono>

namespace calcpilot {

/**
 * @brief Blocking FIFO used to hand log entries to the async logging thread
 * @tparam T Element type
 */
template<typename T>
class ThreadSafeQueue {
public:
    ThreadSafeQueue() : m_closed(false) {}

    /**
     * @brief Push an item
     * @return false if the queue has been closed
     */
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_closed) {
                return false;
            }
            m_queue.push(std::move(item));
        }
        m_condition.notify_one();
        return true;
    }

    /**
     * @brief Pop without blocking
     */
    std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_queue.empty()) {
            return std::nullopt;
        }
        T item = std::move(m_queue.front());
        m_queue.pop();
        return item;
    }

    /**
     * @brief Pop, waiting at most timeoutMs for an item
     * @return Empty on timeout or when closed and drained
     */
    std::optional<T> popWithTimeout(int timeoutMs) {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (!m_condition.wait_for(lock, std::chrono::milliseconds(timeoutMs),
                                  [this] { return !m_queue.empty() || m_closed; })) {
            return std::nullopt;
        }
        if (m_queue.empty()) {
            return std::nullopt;
        }
        T item = std::move(m_queue.front());
        m_queue.pop();
        return item;
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queue.empty();
    }

    /**
     * @brief Reject further pushes and wake every waiter
     */
    void close() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_closed = true;
        }
        m_condition.notify_all();
    }

    /**
     * @brief Accept pushes again after close()
     */
    void reopen() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = false;
    }

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_condition;
    std::queue<T> m_queue;
    bool m_closed;
};

} // namespace calcpilot

#endif // CALCPILOT_THREAD_SAFE_QUEUE_H
