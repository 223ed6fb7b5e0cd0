#pragma once

/**
 * @file compute_service.hpp
 * @brief Background worker that runs orchestrator requests off the host thread
 *
 * Design:
 * - Requests go into a FIFO SimpleQueue and are handled one at a time, in
 *   submission order, by a single worker thread that owns the orchestrator
 * - Every response (progress, result, error) is tagged with the id returned
 *   by submit() and pushed to an outbound queue the host polls
 * - stop() finishes the requests already accepted, then joins the worker
 *
 * Usage:
 *   ComputeService service;
 *   WakeSignal ready;
 *   service.attachConsumer(&ready);
 *   service.start();
 *
 *   uint64_t id = service.submit(InitializeRequest{42, params});
 *   while (ready.wait()) {
 *       for (auto& event : service.drainEvents()) { ... }
 *   }
 */

#include "terraforge/core/simple_queue.hpp"
#include "terraforge/core/wake_signal.hpp"
#include "terraforge/sim/orchestrator.hpp"
#include "terraforge/sim/protocol.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <thread>
#include <vector>

namespace terraforge {

/// One response, tagged with the request it belongs to
struct ServiceEvent {
    uint64_t requestId = 0;
    Response response;
};

class ComputeService {
public:
    explicit ComputeService(GeneratorOptions options = {});
    ~ComputeService();

    // Non-copyable, non-movable (owns a thread)
    ComputeService(const ComputeService&) = delete;
    ComputeService& operator=(const ComputeService&) = delete;
    ComputeService(ComputeService&&) = delete;
    ComputeService& operator=(ComputeService&&) = delete;

    /**
     * @brief Start the worker thread (no-op if already running)
     * @throws std::runtime_error if the service was already stopped
     */
    void start();

    /**
     * @brief Handle every accepted request, then join the worker. Idempotent.
     *
     * If start() was never called the backlog is processed on the calling
     * thread, so every accepted request still gets its terminal response.
     */
    void stop();

    [[nodiscard]] bool isRunning() const { return running_.load(); }

    /**
     * @brief Queue a request
     *
     * Requests may be submitted before start(); they run once it is called.
     *
     * @return Id carried by every ServiceEvent for this request (starts at 1)
     * @throws std::runtime_error if the service was stopped
     */
    uint64_t submit(Request request);

    /// Next event, or nullopt if none is ready (non-blocking)
    std::optional<ServiceEvent> poll() { return events_.tryPop(); }

    /// Every ready event in emission order
    std::vector<ServiceEvent> drainEvents() { return events_.drainAll(); }

    /// Signal `signal` whenever an event is pushed (nullptr to detach)
    void attachConsumer(WakeSignal* signal) { events_.attach(signal); }

    /// Requests accepted but not yet picked up by the worker
    [[nodiscard]] size_t pendingRequests() const { return requests_.size(); }

private:
    struct PendingRequest {
        uint64_t id = 0;
        Request request;
    };

    void workerLoop();
    void process(PendingRequest& pending);

    ComputeOrchestrator orchestrator_;  // Touched only by the worker thread
    SimpleQueue<PendingRequest> requests_;
    SimpleQueue<ServiceEvent> events_;
    WakeSignal wake_;
    std::thread worker_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopped_{false};
    std::atomic<uint64_t> nextId_{1};
};

}  // namespace terraforge
