#pragma once

/**
 * @file orchestrator.hpp
 * @brief Owns the terrain layers and runs full or partial pipelines
 *
 * Full pipeline (initialize / recompute):
 *   heightfield -> climate (whole grid) -> rivers
 * Edit pipeline (editAt):
 *   brush -> climate (dirty rect only) -> rivers (whole grid, flow is global)
 *
 * Every operation validates its input before touching a buffer and publishes
 * a result only after all derivation for the request is done.
 *
 * Not thread-safe: one request at a time. ComputeService provides the
 * queued, single-worker front end.
 */

#include "terraforge/sim/field_set.hpp"
#include "terraforge/sim/protocol.hpp"
#include "terraforge/sim/sim_params.hpp"
#include "terraforge/worldgen/rivers.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace terraforge {

class ComputeOrchestrator {
public:
    using ProgressCallback = std::function<void(Phase, float)>;

    /// @throws std::invalid_argument if `options` fail validateOptions()
    explicit ComputeOrchestrator(GeneratorOptions options = {});

    // Non-copyable (owns large buffers)
    ComputeOrchestrator(const ComputeOrchestrator&) = delete;
    ComputeOrchestrator& operator=(const ComputeOrchestrator&) = delete;

    /**
     * @brief Adopt seed and params, then run the full pipeline
     *
     * Layers are reallocated only when params.size differs from the current
     * size. Reports start (0) and end (1) of each phase through `progress`.
     *
     * @throws std::invalid_argument if params are malformed (state unchanged)
     */
    std::shared_ptr<const FieldSet> initialize(uint32_t seed, const SimParams& params,
                                               const ProgressCallback& progress = {});

    /// initialize() with the current seed
    std::shared_ptr<const FieldSet> recompute(const SimParams& params,
                                              const ProgressCallback& progress = {});

    /**
     * @brief Stamp a brush at (x, y) and re-derive the affected layers
     *
     * No progress is reported on this path.
     *
     * @throws std::invalid_argument for a malformed brush
     * @throws std::logic_error if called before initialize()
     */
    std::shared_ptr<const FieldSet> editAt(int x, int y, const worldgen::Brush& brush);

    /**
     * @brief Protocol entry point
     *
     * Emits progress for full pipelines, then exactly one ResultResponse, or
     * one ErrorResponse if the request threw.
     */
    void handle(const Request& request, const ResponseSink& emit);

    [[nodiscard]] bool initialized() const { return initialized_; }
    [[nodiscard]] int size() const { return fields_.size; }
    [[nodiscard]] uint32_t seed() const { return seed_; }
    [[nodiscard]] const SimParams& params() const { return params_; }
    [[nodiscard]] const GeneratorOptions& options() const { return options_; }

    /// Live layers; valid until the next request
    [[nodiscard]] const FieldSet& fields() const { return fields_; }
    [[nodiscard]] const worldgen::RiverRouter& riverRouter() const { return router_; }

    /// Number of times the layers were (re)allocated
    [[nodiscard]] uint64_t allocationCount() const { return allocations_; }

    [[nodiscard]] Snapshot snapshot(std::string label = {}) const;

private:
    void ensureSize(int size);
    void runFullPipeline(const ProgressCallback& progress);
    void routeRivers();
    [[nodiscard]] std::shared_ptr<const FieldSet> publish() const;

    GeneratorOptions options_;
    uint32_t seed_ = 1;
    SimParams params_;
    FieldSet fields_;
    worldgen::RiverRouter router_;
    bool initialized_ = false;
    uint64_t allocations_ = 0;
};

}  // namespace terraforge
