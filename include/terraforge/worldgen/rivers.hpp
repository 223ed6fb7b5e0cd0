/**
 * @file rivers.hpp
 * @brief D8 flow routing, flow accumulation and the river mask
 *
 * Flow is a global aggregate: one edited cell can change accumulation
 * arbitrarily far downstream, so routing always covers the whole grid.
 *
 * Cells are processed highest first (ties: lower index first) and each pushes
 * its accumulated flow to its steepest strictly-lower neighbour. Equal-height
 * plateaus have no strictly-lower interior neighbour and act as sinks; their
 * flow never reaches the plateau's outlet. That starvation is accepted.
 */

#pragma once

#include <cstdint>
#include <span>
#include <vector>

namespace terraforge::worldgen {

/// Marker for cells with no strictly-lower neighbour
inline constexpr int32_t kNoDownhill = -1;

/**
 * @brief Whole-grid river router
 *
 * Owns its scratch buffers (processing order, downhill targets, accumulation)
 * and reuses them across calls at the same grid size.
 */
class RiverRouter {
public:
    RiverRouter() = default;

    /**
     * @brief Route flow over the whole grid and write the 0/1 river mask
     *
     * rivers[i] = 1 iff accumulation / max accumulation >= threshold and
     * height[i] > seaLevel. Cells at or below sea level contribute nothing.
     * No-op if size <= 0 or the spans are short.
     */
    void route(std::span<const float> height, int size, float seaLevel, float threshold,
               std::span<uint8_t> rivers);

    /// Index of the steepest strictly-lower 8-neighbour, or kNoDownhill
    [[nodiscard]] static int32_t steepestDescent(std::span<const float> height, int size, int x, int y);

    // Results of the last route() call
    [[nodiscard]] const std::vector<float>& accumulation() const { return accum_; }
    [[nodiscard]] const std::vector<int32_t>& downhill() const { return downhill_; }
    [[nodiscard]] const std::vector<uint32_t>& order() const { return order_; }
    [[nodiscard]] float maxAccumulation() const { return maxAccum_; }

private:
    std::vector<uint32_t> order_;
    std::vector<int32_t> downhill_;
    std::vector<float> accum_;
    float maxAccum_ = 0.0f;
};

/**
 * @brief Thicken the mask with `passes` rounds of 4-neighbour dilation
 *
 * Cells at or below sea level are never marked.
 */
void dilateRivers(std::span<uint8_t> rivers, std::span<const float> height, int size,
                  float seaLevel, int passes);

/// Number of cells marked as river
[[nodiscard]] size_t countRiverCells(std::span<const uint8_t> rivers);

}  // namespace terraforge::worldgen
