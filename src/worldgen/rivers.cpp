/**
 * @file rivers.cpp
 * @brief Flow accumulation and river mask extraction
 */

#include "terraforge/worldgen/rivers.hpp"
#include "terraforge/worldgen/grid.hpp"

#include <algorithm>
#include <numeric>

namespace terraforge::worldgen {

int32_t RiverRouter::steepestDescent(std::span<const float> height, int size, int x, int y) {
    x = clampCoord(x, size);
    y = clampCoord(y, size);

    float z = height[cellIndex(x, y, size)];
    int32_t best = kNoDownhill;
    float bestDrop = 0.0f;

    // First neighbour in scan order wins ties
    for (int dy = -1; dy <= 1; ++dy) {
        for (int dx = -1; dx <= 1; ++dx) {
            if (dx == 0 && dy == 0) continue;
            int nx = x + dx;
            int ny = y + dy;
            if (nx < 0 || ny < 0 || nx >= size || ny >= size) continue;

            size_t j = cellIndex(nx, ny, size);
            float drop = z - height[j];
            if (drop > bestDrop) {
                bestDrop = drop;
                best = static_cast<int32_t>(j);
            }
        }
    }
    return best;
}

void RiverRouter::route(std::span<const float> height, int size, float seaLevel, float threshold,
                        std::span<uint8_t> rivers) {
    if (size <= 0) {
        return;
    }
    size_t n = cellIndex(0, size, size);
    if (height.size() < n || rivers.size() < n) {
        return;
    }

    order_.resize(n);
    downhill_.resize(n);
    accum_.assign(n, 0.0f);

    // 1. Downhill target per cell
    for (int y = 0; y < size; ++y) {
        for (int x = 0; x < size; ++x) {
            downhill_[cellIndex(x, y, size)] = steepestDescent(height, size, x, y);
        }
    }

    // 2. Highest first, ties by index so the order is reproducible
    std::iota(order_.begin(), order_.end(), 0u);
    std::sort(order_.begin(), order_.end(), [&height](uint32_t a, uint32_t b) {
        if (height[a] != height[b]) return height[a] > height[b];
        return a < b;
    });

    // 3. Each land cell carries one unit of rain plus everything routed into it
    for (uint32_t i : order_) {
        if (height[i] <= seaLevel) {
            accum_[i] = 0.0f;
            continue;
        }
        float total = accum_[i] + 1.0f;
        accum_[i] = total;
        if (int32_t j = downhill_[i]; j != kNoDownhill) {
            accum_[static_cast<size_t>(j)] += total;
        }
    }

    // 4. Normalize so the threshold is independent of grid size
    maxAccum_ = *std::max_element(accum_.begin(), accum_.end());
    float scale = maxAccum_ > 0.0f ? maxAccum_ : 1.0f;

    // 5. Threshold
    for (size_t i = 0; i < n; ++i) {
        bool land = height[i] > seaLevel;
        rivers[i] = (land && accum_[i] / scale >= threshold) ? 1 : 0;
    }
}

void dilateRivers(std::span<uint8_t> rivers, std::span<const float> height, int size,
                  float seaLevel, int passes) {
    if (size <= 0 || passes <= 0) {
        return;
    }
    size_t n = cellIndex(0, size, size);
    if (rivers.size() < n || height.size() < n) {
        return;
    }

    std::vector<uint8_t> src(rivers.begin(), rivers.begin() + static_cast<std::ptrdiff_t>(n));

    for (int p = 0; p < passes; ++p) {
        for (int y = 0; y < size; ++y) {
            for (int x = 0; x < size; ++x) {
                size_t i = cellIndex(x, y, size);
                if (src[i] || height[i] <= seaLevel) continue;
                if ((x > 0 && src[i - 1]) ||
                    (x + 1 < size && src[i + 1]) ||
                    (y > 0 && src[i - static_cast<size_t>(size)]) ||
                    (y + 1 < size && src[i + static_cast<size_t>(size)])) {
                    rivers[i] = 1;
                }
            }
        }
        std::copy(rivers.begin(), rivers.begin() + static_cast<std::ptrdiff_t>(n), src.begin());
    }
}

size_t countRiverCells(std::span<const uint8_t> rivers) {
    return static_cast<size_t>(std::count_if(rivers.begin(), rivers.end(),
                                             [](uint8_t r) { return r != 0; }));
}

}  // namespace terraforge::worldgen
