#include "terraforge/sim/compute_service.hpp"

#include <iostream>
#include <stdexcept>

namespace terraforge {

ComputeService::ComputeService(GeneratorOptions options)
    : orchestrator_(options) {
    requests_.attach(&wake_);
}

ComputeService::~ComputeService() {
    stop();
}

void ComputeService::start() {
    if (stopped_) {
        throw std::runtime_error("ComputeService: cannot restart after stop()");
    }
    if (running_) {
        return;
    }

    running_ = true;
    worker_ = std::thread(&ComputeService::workerLoop, this);
}

void ComputeService::stop() {
    if (stopped_.exchange(true)) {
        return;
    }

    requests_.shutdown();
    wake_.requestShutdown();

    if (worker_.joinable()) {
        worker_.join();
    } else {
        // Never started: answer the backlog on the calling thread
        while (auto pending = requests_.tryPop()) {
            process(*pending);
        }
    }
    running_ = false;
}

uint64_t ComputeService::submit(Request request) {
    uint64_t id = nextId_.fetch_add(1);
    if (!requests_.push(PendingRequest{id, std::move(request)})) {
        throw std::runtime_error("ComputeService: submit after stop()");
    }
    return id;
}

// ============================================================================
// Worker Thread
// ============================================================================

void ComputeService::workerLoop() {
    for (;;) {
        while (auto pending = requests_.tryPop()) {
            process(*pending);
        }

        // Blocks until push or shutdown
        if (!wake_.wait()) {
            break;
        }
    }

    // Requests accepted before shutdown still get their terminal response
    while (auto pending = requests_.tryPop()) {
        process(*pending);
    }
}

void ComputeService::process(PendingRequest& pending) {
    uint64_t id = pending.id;
    orchestrator_.handle(pending.request, [this, id](Response response) {
        if (auto* error = std::get_if<ErrorResponse>(&response)) {
            std::cerr << "[ComputeService] Request " << id << " failed: " << error->message << "\n";
        }
        events_.push(ServiceEvent{id, std::move(response)});
    });
}

}  // namespace terraforge
