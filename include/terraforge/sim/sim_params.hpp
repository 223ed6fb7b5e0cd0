#pragma once

/**
 * @file sim_params.hpp
 * @brief Request parameters, generator options and boundary validation
 */

#include "terraforge/worldgen/brush.hpp"
#include "terraforge/worldgen/climate.hpp"
#include "terraforge/worldgen/noise.hpp"

#include <cstdint>
#include <string>

namespace terraforge {

/// Largest accepted grid side; 8192² cells is ~900 MB of layers
inline constexpr int kMaxGridSize = 8192;

/// Full parameter set for one initialize/recompute request
struct SimParams {
    int size = 512;
    worldgen::NoiseParams noise;
    worldgen::ClimateParams climate;
    float riverThreshold = 0.01f;  ///< Fraction of the max accumulation
};

/// Orchestrator-wide generation settings, fixed at construction
struct GeneratorOptions {
    float baseFrequency = 1.0f / 128.0f;
    bool islandMask = false;
    int riverDilatePasses = 0;
    bool debugLogging = false;
};

/// Seed and parameters that reproduce a terrain
struct Snapshot {
    uint32_t seed = 1;
    SimParams params;
    std::string label;
};

/**
 * @brief Reject malformed parameters before any buffer is touched
 *
 * @throws std::invalid_argument naming the offending field
 */
void validateParams(const SimParams& params);

/// @throws std::invalid_argument for a non-finite or negative base frequency or negative dilate passes
void validateOptions(const GeneratorOptions& options);

/// @throws std::invalid_argument for a non-positive radius or non-finite strength
void validateBrush(const worldgen::Brush& brush);

}  // namespace terraforge
