#pragma once

/**
 * @file simple_queue.hpp
 * @brief Thread-safe FIFO queue used for compute requests and responses
 *
 * Strict FIFO, no deduplication: every push is delivered exactly once and in
 * push order. Coalescing of rapid edits is the host's job, not the queue's.
 */

#include "terraforge/core/wake_signal.hpp"

#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace terraforge {

/**
 * @brief FIFO queue that optionally signals a WakeSignal on push
 *
 * Usage:
 *   SimpleQueue<Request> requests;
 *   requests.attach(&workerWake);
 *
 *   // Producer:
 *   requests.push(InitializeRequest{seed, params});
 *
 *   // Consumer:
 *   while (auto req = requests.tryPop()) handle(*req);
 *
 * @tparam T Item type (must be movable)
 */
template<typename T>
class SimpleQueue {
public:
    SimpleQueue() = default;
    ~SimpleQueue() = default;

    // Non-copyable, non-movable (owns mutex)
    SimpleQueue(const SimpleQueue&) = delete;
    SimpleQueue& operator=(const SimpleQueue&) = delete;
    SimpleQueue(SimpleQueue&&) = delete;
    SimpleQueue& operator=(SimpleQueue&&) = delete;

    /**
     * @brief Attach to a WakeSignal that is signaled on every push
     *
     * Signals immediately if items are already queued. Pass nullptr to detach.
     */
    void attach(WakeSignal* signal) {
        std::lock_guard<std::mutex> lock(mutex_);
        signal_ = signal;
        if (signal_ && !items_.empty()) {
            signal_->signal();
        }
    }

    /**
     * @brief Append an item
     *
     * @return false if the queue was shut down and the item was dropped
     */
    bool push(T item) {
        WakeSignal* consumer = nullptr;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shutdown_) {
                return false;
            }
            items_.push_back(std::move(item));
            consumer = signal_;
        }
        notify(consumer);
        return true;
    }

    /// Pop the front item, or nullopt if empty (non-blocking)
    std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    /// Take every queued item in FIFO order
    std::vector<T> drainAll() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<T> result;
        result.reserve(items_.size());
        while (!items_.empty()) {
            result.push_back(std::move(items_.front()));
            items_.pop_front();
        }
        return result;
    }

    [[nodiscard]] bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.empty();
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    /**
     * @brief Stop accepting items
     *
     * Queued items stay poppable until drained. Signals the attached
     * WakeSignal so a sleeping consumer notices.
     */
    void shutdown() {
        WakeSignal* consumer = nullptr;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            shutdown_ = true;
            consumer = signal_;
        }
        notify(consumer);
    }

    [[nodiscard]] bool isShutdown() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return shutdown_;
    }

private:
    // Called without the queue lock held
    static void notify(WakeSignal* consumer) {
        if (consumer) consumer->signal();
    }

    mutable std::mutex mutex_;
    std::deque<T> items_;
    WakeSignal* signal_ = nullptr;
    bool shutdown_ = false;
};

}  // namespace terraforge
