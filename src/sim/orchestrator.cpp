#include "terraforge/sim/orchestrator.hpp"
#include "terraforge/worldgen/climate.hpp"
#include "terraforge/worldgen/heightfield.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <type_traits>

namespace terraforge {

namespace {

using Clock = std::chrono::steady_clock;

double elapsedMs(Clock::time_point start) {
    return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

}  // namespace

ComputeOrchestrator::ComputeOrchestrator(GeneratorOptions options)
    : options_(options) {
    validateOptions(options_);
}

std::shared_ptr<const FieldSet> ComputeOrchestrator::initialize(uint32_t seed, const SimParams& params,
                                                                const ProgressCallback& progress) {
    validateParams(params);

    seed_ = seed;
    params_ = params;
    ensureSize(params.size);
    runFullPipeline(progress);
    initialized_ = true;
    return publish();
}

std::shared_ptr<const FieldSet> ComputeOrchestrator::recompute(const SimParams& params,
                                                               const ProgressCallback& progress) {
    return initialize(seed_, params, progress);
}

std::shared_ptr<const FieldSet> ComputeOrchestrator::editAt(int x, int y, const worldgen::Brush& brush) {
    validateBrush(brush);
    if (!initialized_) {
        throw std::logic_error("editAt requires a prior initialize");
    }

    auto start = Clock::now();
    int n = fields_.size;

    worldgen::DirtyRect dirty = worldgen::applyBrush(fields_.height, fields_.moisture, n,
                                                     static_cast<float>(x), static_cast<float>(y), brush);
    if (!dirty.empty()) {
        worldgen::deriveClimate(fields_.climateLayers(), n, params_.climate, dirty);
    }
    routeRivers();

    if (options_.debugLogging) {
        std::cout << "[Orchestrator] " << worldgen::brushKindName(brush.kind) << " at (" << x << ", " << y
                  << ") dirty " << dirty.width() << "x" << dirty.height()
                  << " in " << elapsedMs(start) << " ms\n";
    }
    return publish();
}

void ComputeOrchestrator::handle(const Request& request, const ResponseSink& emit) {
    auto progress = [&emit](Phase phase, float fraction) {
        emit(ProgressResponse{phase, fraction});
    };

    std::shared_ptr<const FieldSet> result;
    try {
        result = std::visit([&](const auto& req) {
            using T = std::decay_t<decltype(req)>;
            if constexpr (std::is_same_v<T, InitializeRequest>) {
                return initialize(req.seed, req.params, progress);
            } else if constexpr (std::is_same_v<T, RecomputeRequest>) {
                return recompute(req.params, progress);
            } else {
                return editAt(req.x, req.y, req.brush);
            }
        }, request);
    } catch (const std::exception& e) {
        std::cerr << "[Orchestrator] " << requestName(request) << " rejected: " << e.what() << "\n";
        emit(ErrorResponse{e.what()});
        return;
    }

    emit(ResultResponse{std::move(result)});
}

Snapshot ComputeOrchestrator::snapshot(std::string label) const {
    return Snapshot{seed_, params_, std::move(label)};
}

void ComputeOrchestrator::ensureSize(int size) {
    if (fields_.size == size && fields_.consistent() && allocations_ > 0) {
        return;
    }
    fields_.resize(size);
    ++allocations_;

    if (options_.debugLogging) {
        std::cout << "[Orchestrator] Allocated " << size << "x" << size << " layers\n";
    }
}

void ComputeOrchestrator::runFullPipeline(const ProgressCallback& progress) {
    auto report = [&progress](Phase phase, float fraction) {
        if (progress) progress(phase, fraction);
    };
    auto logPhase = [this](Phase phase, Clock::time_point start) {
        if (options_.debugLogging) {
            std::cout << "[Orchestrator] " << phaseName(phase) << " phase took "
                      << elapsedMs(start) << " ms\n";
        }
    };

    int n = fields_.size;

    report(Phase::Height, 0.0f);
    auto start = Clock::now();
    worldgen::HeightfieldOptions heightOptions;
    heightOptions.baseFrequency = options_.baseFrequency;
    heightOptions.islandMask = options_.islandMask;
    worldgen::generateHeightField(fields_.height, n, seed_, params_.noise, heightOptions);
    logPhase(Phase::Height, start);
    report(Phase::Height, 1.0f);

    report(Phase::Climate, 0.0f);
    start = Clock::now();
    worldgen::deriveClimate(fields_.climateLayers(), n, params_.climate);
    logPhase(Phase::Climate, start);
    report(Phase::Climate, 1.0f);

    report(Phase::Rivers, 0.0f);
    start = Clock::now();
    routeRivers();
    logPhase(Phase::Rivers, start);
    report(Phase::Rivers, 1.0f);
}

void ComputeOrchestrator::routeRivers() {
    router_.route(fields_.height, fields_.size, params_.climate.seaLevel,
                  params_.riverThreshold, fields_.rivers);
    if (options_.riverDilatePasses > 0) {
        worldgen::dilateRivers(fields_.rivers, fields_.height, fields_.size,
                               params_.climate.seaLevel, options_.riverDilatePasses);
    }
}

std::shared_ptr<const FieldSet> ComputeOrchestrator::publish() const {
    return std::make_shared<const FieldSet>(fields_);
}

}  // namespace terraforge
