/**
 * @file heightfield.hpp
 * @brief Full-grid elevation synthesis from warped fBM
 */

#pragma once

#include "terraforge/worldgen/noise.hpp"

#include <cstdint>
#include <span>

namespace terraforge::worldgen {

struct HeightfieldOptions {
    float baseFrequency = 1.0f / 128.0f;  ///< Overall zoom; 1/128 suits 512² maps
    bool islandMask = false;              ///< Pull elevation toward 0 near the corners
};

/**
 * @brief Fill `out` (size*size, row-major) with normalized elevation
 *
 * Raw warped-fBM values are rescaled with (v - min) / (max - min) so the
 * lowest cell becomes exactly 0 and the highest exactly 1. When every raw
 * sample is equal the identity scale is used. No-op if size <= 0 or `out`
 * is too small.
 */
void generateHeightField(std::span<float> out, int size, uint32_t seed,
                         const NoiseParams& params,
                         const HeightfieldOptions& options = {});

/// 1 - smoothstep(0.7, 1.0, r), r = distance from center / half-diagonal
[[nodiscard]] float islandMaskFactor(int x, int y, int size);

}  // namespace terraforge::worldgen
