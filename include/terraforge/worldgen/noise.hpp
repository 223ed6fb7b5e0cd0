/**
 * @file noise.hpp
 * @brief Lattice value noise, fBM octave stacking and domain warping
 *
 * All noise is deterministic: same seed + coordinates = same output.
 * Output range is [0, 1] for every function in this header.
 */

#pragma once

#include "terraforge/worldgen/random.hpp"

#include <cstdint>

namespace terraforge::worldgen {

/// Fractal and warp parameters (part of SimParams)
struct NoiseParams {
    int octaves = 4;
    float lacunarity = 2.0f;  ///< Frequency multiplier per octave
    float gain = 0.5f;        ///< Amplitude multiplier per octave
    float warp = 0.1f;        ///< Domain warp displacement in pixels
};

// ============================================================================
// Lattice value noise
// ============================================================================

/**
 * @brief 2D value noise on an integer lattice
 *
 * Each lattice corner is hashed through a seeded permutation table to a value
 * in [0, 1]; the four corners of the containing cell are blended bilinearly
 * with the quintic fade 6t^5 - 15t^4 + 10t^3.
 */
class ValueNoise2D {
public:
    explicit ValueNoise2D(uint32_t seed);

    /// Sample at (x, y) scaled by frequency. Returns [0, 1].
    [[nodiscard]] float sample(float x, float y, float frequency = 1.0f) const;

private:
    [[nodiscard]] float latticeValue(int32_t ix, int32_t iy) const;

    PermutationTable perm_;
};

// ============================================================================
// Fractal Brownian motion
// ============================================================================

/**
 * @brief Sum `octaves` samples with frequency baseFreq * lacunarity^k and
 *        amplitude 0.5 * gain^k, divided by the amplitude sum
 *
 * Returns 0 when the amplitude sum is zero (octaves < 1).
 */
[[nodiscard]] float fbm(const ValueNoise2D& noise, float x, float y,
                        const NoiseParams& params, float baseFreq);

/**
 * @brief fBM evaluated at coordinates displaced by two auxiliary fBM fields
 *
 * (dx, dy) = ((fbm(warpX) - 0.5) * warp, (fbm(warpY) - 0.5) * warp), with the
 * auxiliary fields sampled at warpFreq.
 */
[[nodiscard]] float warpedFbm(const ValueNoise2D& base,
                              const ValueNoise2D& warpX,
                              const ValueNoise2D& warpY,
                              float x, float y,
                              const NoiseParams& params,
                              float baseFreq, float warp, float warpFreq);

// ============================================================================
// Terrain noise
// ============================================================================

/// The three decorrelated samplers used for terrain, derived from one world seed
class TerrainNoise {
public:
    // XOR salts; odd so distinct seeds never collapse to the same sampler
    static constexpr uint32_t kBaseSalt = 0x9e3779b9u;
    static constexpr uint32_t kWarpXSalt = 0x517cc1b7u;
    static constexpr uint32_t kWarpYSalt = 0x85ebca6bu;

    explicit TerrainNoise(uint32_t worldSeed);

    /// Warped fBM with the warp field at half of baseFreq
    [[nodiscard]] float evaluate(float x, float y, const NoiseParams& params, float baseFreq) const;

    [[nodiscard]] const ValueNoise2D& base() const { return base_; }

private:
    ValueNoise2D base_;
    ValueNoise2D warpX_;
    ValueNoise2D warpY_;
};

}  // namespace terraforge::worldgen
