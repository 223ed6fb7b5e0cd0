#pragma once

/**
 * @file wake_signal.hpp
 * @brief Wake mechanism between request producers and the compute worker
 *
 * The compute worker sleeps on a WakeSignal until a request arrives or the
 * service shuts down. Hosts can attach their own WakeSignal to the outbound
 * response queue to block until progress or a result is available.
 */

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace terraforge {

/**
 * @brief Condition-variable wrapper with sticky signal and shutdown states
 *
 * A signal() issued while nobody waits is remembered, so the next wait()
 * returns immediately. Shutdown is permanent until reset().
 *
 * Usage:
 *   WakeSignal wake;
 *   requests.attach(&wake);
 *
 *   // Worker loop:
 *   while (wake.wait()) {
 *       while (auto req = requests.tryPop()) handle(*req);
 *   }
 */
class WakeSignal {
public:
    using Clock = std::chrono::steady_clock;

    WakeSignal() = default;
    ~WakeSignal() = default;

    // Non-copyable, non-movable (owns synchronization primitives)
    WakeSignal(const WakeSignal&) = delete;
    WakeSignal& operator=(const WakeSignal&) = delete;
    WakeSignal(WakeSignal&&) = delete;
    WakeSignal& operator=(WakeSignal&&) = delete;

    /// Mark work as available and wake every waiter
    void signal() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            signaled_ = true;
        }
        cv_.notify_all();
    }

    /**
     * @brief Block until signaled or shutdown
     *
     * Clears the signaled state before returning.
     *
     * @return true if woken by signal(), false if shutdown was requested
     */
    bool wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return shutdown_ || signaled_; });
        signaled_ = false;
        return !shutdown_;
    }

    /**
     * @brief Block until signaled, shutdown, or timeout
     *
     * @return false only if shutdown was requested; a timeout returns true
     */
    bool waitFor(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_until(lock, Clock::now() + timeout,
                       [this]() { return shutdown_ || signaled_; });
        signaled_ = false;
        return !shutdown_;
    }

    /// All current and future wait() calls return false
    void requestShutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            shutdown_ = true;
        }
        cv_.notify_all();
    }

    [[nodiscard]] bool isShutdown() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return shutdown_;
    }

    /// Clear signaled and shutdown state so the signal can be reused
    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        signaled_ = false;
        shutdown_ = false;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;

    bool signaled_ = false;
    bool shutdown_ = false;
};

}  // namespace terraforge
