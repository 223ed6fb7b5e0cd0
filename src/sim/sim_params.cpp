#include "terraforge/sim/sim_params.hpp"

#include <cmath>
#include <stdexcept>

namespace terraforge {

namespace {

void requireFinite(float v, const char* name) {
    if (!std::isfinite(v)) {
        throw std::invalid_argument(std::string(name) + " must be finite");
    }
}

}  // namespace

void validateParams(const SimParams& params) {
    if (params.size <= 0 || params.size > kMaxGridSize) {
        throw std::invalid_argument("size must be in [1, " + std::to_string(kMaxGridSize) +
                                    "], got " + std::to_string(params.size));
    }
    if (params.noise.octaves < 1) {
        throw std::invalid_argument("noise.octaves must be >= 1, got " +
                                    std::to_string(params.noise.octaves));
    }

    requireFinite(params.noise.lacunarity, "noise.lacunarity");
    requireFinite(params.noise.gain, "noise.gain");
    requireFinite(params.noise.warp, "noise.warp");
    requireFinite(params.climate.seaLevel, "climate.seaLevel");
    requireFinite(params.climate.tempLapse, "climate.tempLapse");
    requireFinite(params.climate.moistureShift, "climate.moistureShift");
    requireFinite(params.riverThreshold, "riverThreshold");

    if (params.noise.lacunarity <= 0.0f) {
        throw std::invalid_argument("noise.lacunarity must be positive");
    }
    if (params.noise.gain <= 0.0f) {
        throw std::invalid_argument("noise.gain must be positive");
    }
    if (params.noise.warp < 0.0f) {
        throw std::invalid_argument("noise.warp must be non-negative");
    }
    if (params.riverThreshold < 0.0f) {
        throw std::invalid_argument("riverThreshold must be non-negative");
    }
}

void validateOptions(const GeneratorOptions& options) {
    requireFinite(options.baseFrequency, "generation.base_frequency");
    if (options.baseFrequency < 0.0f) {
        throw std::invalid_argument("generation.base_frequency must be non-negative");
    }
    if (options.riverDilatePasses < 0) {
        throw std::invalid_argument("rivers.dilate_passes must be >= 0, got " +
                                    std::to_string(options.riverDilatePasses));
    }
}

void validateBrush(const worldgen::Brush& brush) {
    if (!std::isfinite(brush.radius) || brush.radius <= 0.0f) {
        throw std::invalid_argument("Brush radius must be positive");
    }
    requireFinite(brush.strength, "Brush strength");
}

}  // namespace terraforge
