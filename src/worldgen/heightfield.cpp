/**
 * @file heightfield.cpp
 * @brief Heightfield generation and normalization
 */

#include "terraforge/worldgen/heightfield.hpp"
#include "terraforge/worldgen/grid.hpp"

#include <glm/glm.hpp>

#include <limits>

namespace terraforge::worldgen {

float islandMaskFactor(int x, int y, int size) {
    glm::vec2 center(static_cast<float>(size - 1) * 0.5f);
    float maxR = glm::length(center);
    if (maxR <= 0.0f) {
        return 1.0f;
    }

    glm::vec2 d = (glm::vec2(static_cast<float>(x), static_cast<float>(y)) - center) / maxR;
    return 1.0f - glm::smoothstep(0.7f, 1.0f, glm::length(d));
}

void generateHeightField(std::span<float> out, int size, uint32_t seed,
                         const NoiseParams& params,
                         const HeightfieldOptions& options) {
    if (size <= 0 || out.size() < cellIndex(0, size, size)) {
        return;
    }

    TerrainNoise noise(seed);

    // Raw pass, tracking the range in the same sweep
    float minV = std::numeric_limits<float>::infinity();
    float maxV = -std::numeric_limits<float>::infinity();
    for (int y = 0; y < size; ++y) {
        for (int x = 0; x < size; ++x) {
            float v = noise.evaluate(static_cast<float>(x), static_cast<float>(y),
                                     params, options.baseFrequency);
            out[cellIndex(x, y, size)] = v;
            minV = glm::min(minV, v);
            maxV = glm::max(maxV, v);
        }
    }

    float range = maxV > minV ? maxV - minV : 1.0f;

    for (int y = 0; y < size; ++y) {
        for (int x = 0; x < size; ++x) {
            size_t i = cellIndex(x, y, size);
            float h = (out[i] - minV) / range;
            if (options.islandMask) {
                h *= islandMaskFactor(x, y, size);
            }
            out[i] = h;
        }
    }
}

}  // namespace terraforge::worldgen
