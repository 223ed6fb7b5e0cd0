#pragma once

/**
 * @file field_set.hpp
 * @brief The five parallel terrain layers and summary statistics
 */

#include "terraforge/worldgen/climate.hpp"

#include <array>
#include <cstdint>
#include <vector>

namespace terraforge {

/**
 * @brief Five same-length row-major layers (index = y * size + x)
 *
 * height, temperature in [0, 1]; moisture nominally [0, 1]; rivers 0/1;
 * biomes a worldgen::Biome index.
 */
struct FieldSet {
    int size = 0;
    std::vector<float> height;
    std::vector<float> temperature;
    std::vector<float> moisture;
    std::vector<uint8_t> rivers;
    std::vector<uint8_t> biomes;

    /// Reallocate every layer to size*size, zero-filled
    void resize(int newSize);

    [[nodiscard]] size_t cellCount() const { return height.size(); }

    /// All five layers have size*size entries
    [[nodiscard]] bool consistent() const;

    [[nodiscard]] worldgen::ClimateLayers climateLayers() {
        return {height, temperature, moisture, biomes};
    }
};

struct FieldStats {
    size_t cells = 0;
    size_t landCells = 0;   ///< height > seaLevel
    size_t riverCells = 0;
    float minHeight = 0.0f;
    float maxHeight = 0.0f;
    float meanHeight = 0.0f;
    std::array<size_t, worldgen::kBiomeCount> biomeCounts{};

    [[nodiscard]] float landFraction() const {
        return cells ? static_cast<float>(landCells) / static_cast<float>(cells) : 0.0f;
    }
};

[[nodiscard]] FieldStats summarize(const FieldSet& fields, float seaLevel);

}  // namespace terraforge
