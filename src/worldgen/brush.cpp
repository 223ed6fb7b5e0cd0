/**
 * @file brush.cpp
 * @brief Raise, lower, smooth and rain stamps
 */

#include "terraforge/worldgen/brush.hpp"

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

#include <cmath>
#include <stdexcept>
#include <vector>

namespace terraforge::worldgen {

namespace {

/// floor/ceil to int after pulling far-off values back near the grid
int floorToGrid(float v, int size) {
    return static_cast<int>(std::floor(glm::clamp(v, -2.0f, static_cast<float>(size) + 1.0f)));
}

int ceilToGrid(float v, int size) {
    return static_cast<int>(std::ceil(glm::clamp(v, -2.0f, static_cast<float>(size) + 1.0f)));
}

/// Add strength * cosineFalloff to every cell within radius of (cx, cy)
void radialAdd(std::span<float> field, int size, float cx, float cy,
               float radius, float strength) {
    glm::vec2 center(cx, cy);
    float r2 = radius * radius;

    int x0 = std::max(0, floorToGrid(cx - radius, size));
    int y0 = std::max(0, floorToGrid(cy - radius, size));
    int x1 = std::min(size - 1, ceilToGrid(cx + radius, size));
    int y1 = std::min(size - 1, ceilToGrid(cy + radius, size));

    for (int y = y0; y <= y1; ++y) {
        for (int x = x0; x <= x1; ++x) {
            glm::vec2 delta = glm::vec2(static_cast<float>(x), static_cast<float>(y)) - center;
            float d2 = glm::dot(delta, delta);
            if (d2 > r2) continue;
            field[cellIndex(x, y, size)] += strength * cosineFalloff(std::sqrt(d2), radius);
        }
    }
}

void clampRegion(std::span<float> field, int size, const DirtyRect& rect) {
    for (int y = rect.y0; y <= rect.y1; ++y) {
        for (int x = rect.x0; x <= rect.x1; ++x) {
            float& v = field[cellIndex(x, y, size)];
            v = glm::clamp(v, 0.0f, 1.0f);
        }
    }
}

/**
 * Horizontal then vertical sliding-window mean of width 2k+1, edge-clamped,
 * blended into the original by alpha over `bounds`. k is capped at `size`. The horizontal pass also
 * covers k rows above and below so the vertical window sees blurred rows.
 */
void smoothRegion(std::span<float> field, int size, const DirtyRect& bounds,
                  float kernelRadius, float alpha) {
    // A window wider than the grid is capped at the grid side
    float cap = static_cast<float>(std::max(1, size));
    int k = std::max(1, static_cast<int>(std::floor(glm::clamp(kernelRadius, 1.0f, cap))));
    float norm = 1.0f / static_cast<float>(2 * k + 1);
    alpha = glm::clamp(alpha, 0.0f, 1.0f);

    int w = bounds.width();
    int ry0 = std::max(0, bounds.y0 - k);
    int ry1 = std::min(size - 1, bounds.y1 + k);
    int rows = ry1 - ry0 + 1;

    std::vector<float> tmp(static_cast<size_t>(w) * static_cast<size_t>(rows));
    auto tmpAt = [&](int row, int col) -> float& {
        return tmp[static_cast<size_t>(row - ry0) * static_cast<size_t>(w) + static_cast<size_t>(col)];
    };

    for (int y = ry0; y <= ry1; ++y) {
        float sum = 0.0f;
        for (int j = -k; j <= k; ++j) {
            sum += field[cellIndex(clampCoord(bounds.x0 + j, size), y, size)];
        }
        for (int x = bounds.x0; x <= bounds.x1; ++x) {
            tmpAt(y, x - bounds.x0) = sum * norm;
            sum += field[cellIndex(clampCoord(x + k + 1, size), y, size)]
                 - field[cellIndex(clampCoord(x - k, size), y, size)];
        }
    }

    auto clampRow = [&](int y) { return y < ry0 ? ry0 : (y > ry1 ? ry1 : y); };

    for (int col = 0; col < w; ++col) {
        float sum = 0.0f;
        for (int j = -k; j <= k; ++j) {
            sum += tmpAt(clampRow(bounds.y0 + j), col);
        }
        for (int y = bounds.y0; y <= bounds.y1; ++y) {
            float blurred = sum * norm;
            float& v = field[cellIndex(bounds.x0 + col, y, size)];
            v = v * (1.0f - alpha) + blurred * alpha;
            sum += tmpAt(clampRow(y + k + 1), col) - tmpAt(clampRow(y - k), col);
        }
    }
}

}  // namespace

std::string_view brushKindName(BrushKind kind) {
    switch (kind) {
        case BrushKind::Raise: return "raise";
        case BrushKind::Lower: return "lower";
        case BrushKind::Smooth: return "smooth";
        case BrushKind::Rain: return "rain";
    }
    return "unknown";
}

std::optional<BrushKind> parseBrushKind(std::string_view name) {
    if (name == "raise") return BrushKind::Raise;
    if (name == "lower") return BrushKind::Lower;
    if (name == "smooth") return BrushKind::Smooth;
    if (name == "rain") return BrushKind::Rain;
    return std::nullopt;
}

float cosineFalloff(float distance, float radius) {
    if (radius <= 0.0f || distance > radius) {
        return 0.0f;
    }
    return 0.5f * (1.0f + std::cos(glm::pi<float>() * distance / radius));
}

DirtyRect strokeBounds(float cx, float cy, float radius, int size, int pad) {
    if (size <= 0) {
        return DirtyRect{};
    }
    float r = std::max(1.0f, std::ceil(radius));
    auto fpad = static_cast<float>(pad);
    DirtyRect rect{floorToGrid(cx - r - fpad, size), floorToGrid(cy - r - fpad, size),
                   ceilToGrid(cx + r + fpad, size), ceilToGrid(cy + r + fpad, size)};
    return rect.clampedTo(size);
}

DirtyRect applyBrush(std::span<float> height, std::span<float> moisture, int size,
                     float cx, float cy, const Brush& brush) {
    if (!std::isfinite(brush.radius) || brush.radius <= 0.0f) {
        throw std::invalid_argument("Brush radius must be positive");
    }
    if (!std::isfinite(brush.strength) || !std::isfinite(cx) || !std::isfinite(cy)) {
        throw std::invalid_argument("Brush strength and position must be finite");
    }
    if (size <= 0 || height.size() < cellIndex(0, size, size)) {
        return DirtyRect{};
    }

    DirtyRect bounds = strokeBounds(cx, cy, brush.radius, size, brushPadding(brush.kind));
    if (bounds.empty()) {
        return bounds;
    }

    switch (brush.kind) {
        case BrushKind::Raise:
        case BrushKind::Lower: {
            float s = brush.kind == BrushKind::Raise ? brush.strength : -brush.strength;
            radialAdd(height, size, cx, cy, brush.radius, s);
            clampRegion(height, size, bounds);
            break;
        }
        case BrushKind::Smooth: {
            // Blend only the unpadded box; the padding covers the moisture stencil
            DirtyRect inner = strokeBounds(cx, cy, brush.radius, size, 0);
            if (!inner.empty()) {
                smoothRegion(height, size, inner, brush.radius, brush.strength);
                clampRegion(height, size, inner);
            }
            break;
        }
        case BrushKind::Rain:
            if (moisture.size() >= cellIndex(0, size, size)) {
                radialAdd(moisture, size, cx, cy, brush.radius, brush.strength);
                clampRegion(moisture, size, bounds);
            }
            break;
    }

    return bounds;
}

}  // namespace terraforge::worldgen
