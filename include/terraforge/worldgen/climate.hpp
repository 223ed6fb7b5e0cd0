/**
 * @file climate.hpp
 * @brief Temperature, moisture and biome layers derived from elevation
 *
 * Every function works on the whole grid or on a sub-rectangle, so brush
 * edits only re-derive the cells they touched. Rectangles are clipped to
 * the grid; an empty rectangle is a no-op.
 */

#pragma once

#include "terraforge/worldgen/grid.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <string_view>

namespace terraforge::worldgen {

// ============================================================================
// Biome table
// ============================================================================

/// Biome enum index as stored in the biomes layer
enum class Biome : uint8_t {
    Ocean = 0,
    Beach,
    Desert,
    Savanna,
    Grassland,
    Shrubland,
    TemperateForest,
    BorealForest,
    Rainforest,
    Tundra,
    Mountain,
    Snow,
};

inline constexpr size_t kBiomeCount = 12;

[[nodiscard]] std::string_view biomeName(Biome biome);

// ============================================================================
// Parameters
// ============================================================================

struct ClimateParams {
    float seaLevel = 0.4f;
    float tempLapse = 0.5f;      ///< Temperature drop per unit elevation
    float moistureShift = 0.0f;  ///< Global wet/dry bias
};

// Classification thresholds
inline constexpr float kBeachBand = 0.02f;
inline constexpr float kSnowHeight = 0.88f;
inline constexpr float kSnowMaxTemperature = 0.45f;
inline constexpr float kMountainHeight = 0.84f;

// ============================================================================
// Per-cell rules
// ============================================================================

/// 0 on the equator row, 1 on the first and last rows
[[nodiscard]] float poleFactor(int y, int size);

/**
 * @brief Ordered decision list, first match wins
 *
 * Ocean, Beach, Snow, Mountain, then a 3x3 temperature/moisture table.
 */
[[nodiscard]] Biome classifyBiome(float height, float temperature, float moisture, float seaLevel);

// ============================================================================
// Layer passes
// ============================================================================

/// temperature = clamp01(1 - tempLapse * h - 0.6 * poleFactor(y))
void computeTemperature(std::span<const float> height, int size, const ClimateParams& params,
                        std::span<float> out, const DirtyRect& rect);

/**
 * @brief moisture = clamp01(1 - h + shift + 0.15 * max(0, s) - 0.10 * max(0, -s))
 *
 * s is the east-minus-west height difference; edge cells use their own
 * height for the missing neighbour.
 */
void computeMoisture(std::span<const float> height, int size, const ClimateParams& params,
                     std::span<float> out, const DirtyRect& rect);

void classifyBiomes(std::span<const float> height, std::span<const float> temperature,
                    std::span<const float> moisture, int size, const ClimateParams& params,
                    std::span<uint8_t> out, const DirtyRect& rect);

/// Mutable views of the layers the climate pass writes
struct ClimateLayers {
    std::span<const float> height;
    std::span<float> temperature;
    std::span<float> moisture;
    std::span<uint8_t> biomes;
};

/// Temperature, then moisture, then biomes over `rect`
void deriveClimate(const ClimateLayers& layers, int size, const ClimateParams& params,
                   const DirtyRect& rect);

/// Whole-grid variant
void deriveClimate(const ClimateLayers& layers, int size, const ClimateParams& params);

}  // namespace terraforge::worldgen
