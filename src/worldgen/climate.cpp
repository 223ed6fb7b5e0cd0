/**
 * @file climate.cpp
 * @brief Climate layer derivation and biome classification
 */

#include "terraforge/worldgen/climate.hpp"

#include <glm/glm.hpp>

#include <cmath>

namespace terraforge::worldgen {

namespace {

constexpr std::array<std::string_view, kBiomeCount> kBiomeNames = {
    "ocean", "beach", "desert", "savanna", "grassland", "shrubland",
    "temperate_forest", "boreal_forest", "rainforest", "tundra", "mountain", "snow",
};

/// Clip rect to the grid; empty when size <= 0 or the spans are short
DirtyRect usableRect(const DirtyRect& rect, int size, size_t minSpan) {
    if (size <= 0 || minSpan < cellIndex(0, size, size)) {
        return DirtyRect{};
    }
    return rect.clampedTo(size);
}

}  // namespace

std::string_view biomeName(Biome biome) {
    auto i = static_cast<size_t>(biome);
    return i < kBiomeCount ? kBiomeNames[i] : std::string_view("unknown");
}

float poleFactor(int y, int size) {
    if (size <= 1) {
        return 0.0f;
    }
    float lat = static_cast<float>(y) / static_cast<float>(size - 1);
    return std::abs(lat - 0.5f) * 2.0f;
}

Biome classifyBiome(float height, float temperature, float moisture, float seaLevel) {
    if (height < seaLevel) return Biome::Ocean;
    if (height < seaLevel + kBeachBand) return Biome::Beach;
    if (height > kSnowHeight && temperature < kSnowMaxTemperature) return Biome::Snow;
    if (height > kMountainHeight) return Biome::Mountain;

    if (temperature < 0.33f) {
        return moisture < 0.35f ? Biome::Tundra : Biome::BorealForest;
    }
    if (temperature < 0.66f) {
        if (moisture < 0.30f) return Biome::Shrubland;
        if (moisture < 0.55f) return Biome::Grassland;
        return Biome::TemperateForest;
    }
    if (moisture < 0.28f) return Biome::Desert;
    if (moisture < 0.55f) return Biome::Savanna;
    return Biome::Rainforest;
}

void computeTemperature(std::span<const float> height, int size, const ClimateParams& params,
                        std::span<float> out, const DirtyRect& rect) {
    DirtyRect r = usableRect(rect, size, std::min(height.size(), out.size()));

    for (int y = r.y0; y <= r.y1; ++y) {
        float pole = poleFactor(y, size);
        for (int x = r.x0; x <= r.x1; ++x) {
            size_t i = cellIndex(x, y, size);
            out[i] = glm::clamp(1.0f - params.tempLapse * height[i] - 0.6f * pole, 0.0f, 1.0f);
        }
    }
}

void computeMoisture(std::span<const float> height, int size, const ClimateParams& params,
                     std::span<float> out, const DirtyRect& rect) {
    DirtyRect r = usableRect(rect, size, std::min(height.size(), out.size()));

    for (int y = r.y0; y <= r.y1; ++y) {
        for (int x = r.x0; x <= r.x1; ++x) {
            size_t i = cellIndex(x, y, size);
            float h = height[i];
            float west = x > 0 ? height[i - 1] : h;
            float east = x < size - 1 ? height[i + 1] : h;

            // Rising terrain to the east catches rain, falling terrain is in shadow
            float slope = east - west;
            float m = 1.0f - h + params.moistureShift
                    + 0.15f * glm::max(0.0f, slope)
                    - 0.10f * glm::max(0.0f, -slope);
            out[i] = glm::clamp(m, 0.0f, 1.0f);
        }
    }
}

void classifyBiomes(std::span<const float> height, std::span<const float> temperature,
                    std::span<const float> moisture, int size, const ClimateParams& params,
                    std::span<uint8_t> out, const DirtyRect& rect) {
    size_t minSpan = std::min({height.size(), temperature.size(), moisture.size(), out.size()});
    DirtyRect r = usableRect(rect, size, minSpan);

    for (int y = r.y0; y <= r.y1; ++y) {
        for (int x = r.x0; x <= r.x1; ++x) {
            size_t i = cellIndex(x, y, size);
            out[i] = static_cast<uint8_t>(
                classifyBiome(height[i], temperature[i], moisture[i], params.seaLevel));
        }
    }
}

void deriveClimate(const ClimateLayers& layers, int size, const ClimateParams& params,
                   const DirtyRect& rect) {
    computeTemperature(layers.height, size, params, layers.temperature, rect);
    computeMoisture(layers.height, size, params, layers.moisture, rect);
    classifyBiomes(layers.height, layers.temperature, layers.moisture, size, params,
                   layers.biomes, rect);
}

void deriveClimate(const ClimateLayers& layers, int size, const ClimateParams& params) {
    deriveClimate(layers, size, params, DirtyRect::full(size));
}

}  // namespace terraforge::worldgen
