/**
 * @file brush.hpp
 * @brief Local stamp operators that edit elevation and moisture in place
 */

#pragma once

#include "terraforge/worldgen/grid.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace terraforge::worldgen {

enum class BrushKind : uint8_t {
    Raise,
    Lower,
    Smooth,
    Rain,
};

[[nodiscard]] std::string_view brushKindName(BrushKind kind);
[[nodiscard]] std::optional<BrushKind> parseBrushKind(std::string_view name);

/// Transient stamp description, supplied with each edit
struct Brush {
    BrushKind kind = BrushKind::Raise;
    float radius = 5.0f;    ///< Pixels, must be positive
    float strength = 0.1f;  ///< Height delta (raise/lower/rain) or blend alpha (smooth)
};

/// Dirty-rect padding beyond the stroke: 2 for smooth (blur support), else 1
[[nodiscard]] constexpr int brushPadding(BrushKind kind) {
    return kind == BrushKind::Smooth ? 2 : 1;
}

/// 0.5 * (1 + cos(pi * d / radius)) inside the radius, 0 outside
[[nodiscard]] float cosineFalloff(float distance, float radius);

/**
 * @brief Bounding box of a circular stroke, padded and clipped to the grid
 *
 * Uses max(1, ceil(radius)) so the box always covers the whole disk.
 */
[[nodiscard]] DirtyRect strokeBounds(float cx, float cy, float radius, int size, int pad);

/**
 * @brief Stamp `brush` centred on (cx, cy)
 *
 * - Raise/Lower add +/- strength * falloff to height, then clamp to [0, 1].
 * - Smooth blends a separable edge-clamped box blur of half-width
 *   max(1, floor(radius)), capped at size, into the unpadded stroke box with
 *   alpha = strength.
 * - Rain adds strength * falloff to moisture (if `moisture` is non-empty);
 *   height is untouched.
 *
 * @return The rectangle that may have changed; the authoritative scope for
 *         any partial re-derivation. Empty when the stroke misses the grid.
 * @throws std::invalid_argument if radius is not positive or a value is not finite
 */
DirtyRect applyBrush(std::span<float> height, std::span<float> moisture, int size,
                     float cx, float cy, const Brush& brush);

}  // namespace terraforge::worldgen
