#pragma once

/**
 * @file grid.hpp
 * @brief Square-grid indexing helpers and the dirty rectangle type
 *
 * Every layer is a flat row-major array of size*size cells,
 * index = y * size + x.
 */

#include <algorithm>
#include <cstddef>

namespace terraforge::worldgen {

/// Row-major cell index (caller guarantees 0 <= x, y < size)
[[nodiscard]] constexpr size_t cellIndex(int x, int y, int size) {
    return static_cast<size_t>(y) * static_cast<size_t>(size) + static_cast<size_t>(x);
}

/// Clamp a coordinate into [0, size - 1]
[[nodiscard]] constexpr int clampCoord(int v, int size) {
    return v < 0 ? 0 : (v >= size ? size - 1 : v);
}

[[nodiscard]] constexpr float clamp01(float v) {
    return v < 0.0f ? 0.0f : (v > 1.0f ? 1.0f : v);
}

/**
 * @brief Inclusive pixel bounding box {x0, y0} .. {x1, y1}
 *
 * A rectangle with x0 > x1 or y0 > y1 is empty (a stroke that missed the grid).
 */
struct DirtyRect {
    int x0 = 0;
    int y0 = 0;
    int x1 = -1;
    int y1 = -1;

    /// Whole grid
    [[nodiscard]] static constexpr DirtyRect full(int size) {
        return DirtyRect{0, 0, size - 1, size - 1};
    }

    [[nodiscard]] constexpr bool empty() const { return x0 > x1 || y0 > y1; }
    [[nodiscard]] constexpr int width() const { return empty() ? 0 : x1 - x0 + 1; }
    [[nodiscard]] constexpr int height() const { return empty() ? 0 : y1 - y0 + 1; }

    [[nodiscard]] constexpr bool contains(int x, int y) const {
        return x >= x0 && x <= x1 && y >= y0 && y <= y1;
    }

    /// Intersection with the grid [0, size)
    [[nodiscard]] constexpr DirtyRect clampedTo(int size) const {
        return DirtyRect{std::max(x0, 0), std::max(y0, 0),
                         std::min(x1, size - 1), std::min(y1, size - 1)};
    }

    [[nodiscard]] constexpr bool operator==(const DirtyRect&) const = default;
};

}  // namespace terraforge::worldgen
