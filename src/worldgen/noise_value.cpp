/**
 * @file noise_value.cpp
 * @brief Value noise, fBM and domain-warped terrain noise
 */

#include "terraforge/worldgen/noise.hpp"

#include <cmath>

namespace terraforge::worldgen {

namespace {

/// Quintic fade curve: 6t^5 - 15t^4 + 10t^3
inline float fade(float t) {
    return t * t * t * (t * (t * 6.0f - 15.0f) + 10.0f);
}

inline float lerp(float a, float b, float t) {
    return a + (b - a) * t;
}

/// Lattice coordinate reduced to 0..255; the hash only sees the low 8 bits
inline int32_t wrapLattice(float fl) {
    float m = std::fmod(fl, 256.0f);
    if (m < 0.0f) m += 256.0f;
    return static_cast<int32_t>(m);
}

}  // namespace

// ============================================================================
// ValueNoise2D
// ============================================================================

ValueNoise2D::ValueNoise2D(uint32_t seed)
    : perm_(seed) {
}

float ValueNoise2D::latticeValue(int32_t ix, int32_t iy) const {
    return static_cast<float>(perm_.hash(ix, iy)) / 255.0f;
}

float ValueNoise2D::sample(float x, float y, float frequency) const {
    float fx = x * frequency;
    float fy = y * frequency;
    if (!std::isfinite(fx)) fx = 0.0f;
    if (!std::isfinite(fy)) fy = 0.0f;

    float flx = std::floor(fx);
    float fly = std::floor(fy);
    int32_t x0 = wrapLattice(flx);
    int32_t y0 = wrapLattice(fly);

    float u = fade(fx - flx);
    float v = fade(fy - fly);

    float v00 = latticeValue(x0, y0);
    float v10 = latticeValue(x0 + 1, y0);
    float v01 = latticeValue(x0, y0 + 1);
    float v11 = latticeValue(x0 + 1, y0 + 1);

    return lerp(lerp(v00, v10, u), lerp(v01, v11, u), v);
}

// ============================================================================
// fBM
// ============================================================================

float fbm(const ValueNoise2D& noise, float x, float y,
          const NoiseParams& params, float baseFreq) {
    float amplitude = 0.5f;
    float frequency = baseFreq;
    float sum = 0.0f;
    float norm = 0.0f;

    for (int o = 0; o < params.octaves; ++o) {
        // Octaves past float range add nothing representable
        if (!std::isfinite(frequency) || !std::isfinite(norm + amplitude)) {
            break;
        }
        sum += noise.sample(x, y, frequency) * amplitude;
        norm += amplitude;
        frequency *= params.lacunarity;
        amplitude *= params.gain;
    }

    return norm > 0.0f ? sum / norm : 0.0f;
}

float warpedFbm(const ValueNoise2D& base,
                const ValueNoise2D& warpX,
                const ValueNoise2D& warpY,
                float x, float y,
                const NoiseParams& params,
                float baseFreq, float warp, float warpFreq) {
    // Center the displacement on zero
    float dx = (fbm(warpX, x, y, params, warpFreq) - 0.5f) * warp;
    float dy = (fbm(warpY, x, y, params, warpFreq) - 0.5f) * warp;
    return fbm(base, x + dx, y + dy, params, baseFreq);
}

// ============================================================================
// TerrainNoise
// ============================================================================

TerrainNoise::TerrainNoise(uint32_t worldSeed)
    : base_(worldSeed ^ kBaseSalt),
      warpX_(worldSeed ^ kWarpXSalt),
      warpY_(worldSeed ^ kWarpYSalt) {
}

float TerrainNoise::evaluate(float x, float y, const NoiseParams& params, float baseFreq) const {
    return warpedFbm(base_, warpX_, warpY_, x, y, params,
                     baseFreq, params.warp, baseFreq * 0.5f);
}

}  // namespace terraforge::worldgen
