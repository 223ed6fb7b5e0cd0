/**
 * @file test_brush.cpp
 * @brief Tests for raise, lower, smooth and rain brushes
 */

#include "terraforge/worldgen/brush.hpp"
#include "terraforge/worldgen/heightfield.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

using namespace terraforge::worldgen;

namespace {

std::vector<float> filled(int size, float value) {
    return std::vector<float>(static_cast<size_t>(size) * static_cast<size_t>(size), value);
}

/// Every cell that differs between before and after lies inside rect
void expectChangesInside(const std::vector<float>& before, const std::vector<float>& after,
                         int size, const DirtyRect& rect) {
    for (int y = 0; y < size; ++y) {
        for (int x = 0; x < size; ++x) {
            size_t i = cellIndex(x, y, size);
            if (before[i] != after[i]) {
                EXPECT_TRUE(rect.contains(x, y)) << "changed cell (" << x << ", " << y << ") outside rect";
            }
        }
    }
}

}  // namespace

// ============================================================================
// Helpers
// ============================================================================

TEST(BrushKindTest, NamesRoundTrip) {
    for (auto kind : {BrushKind::Raise, BrushKind::Lower, BrushKind::Smooth, BrushKind::Rain}) {
        auto parsed = parseBrushKind(brushKindName(kind));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, kind);
    }
    EXPECT_FALSE(parseBrushKind("erode").has_value());
    EXPECT_FALSE(parseBrushKind("").has_value());
}

TEST(BrushKindTest, Padding) {
    EXPECT_EQ(brushPadding(BrushKind::Smooth), 2);
    EXPECT_EQ(brushPadding(BrushKind::Raise), 1);
    EXPECT_EQ(brushPadding(BrushKind::Lower), 1);
    EXPECT_EQ(brushPadding(BrushKind::Rain), 1);
}

TEST(CosineFalloffTest, Shape) {
    EXPECT_FLOAT_EQ(cosineFalloff(0.0f, 4.0f), 1.0f);
    EXPECT_NEAR(cosineFalloff(2.0f, 4.0f), 0.5f, 1e-6f);
    EXPECT_NEAR(cosineFalloff(4.0f, 4.0f), 0.0f, 1e-6f);
    EXPECT_EQ(cosineFalloff(4.01f, 4.0f), 0.0f);
    EXPECT_EQ(cosineFalloff(0.0f, 0.0f), 0.0f);
}

TEST(StrokeBoundsTest, PaddedAndCeiled) {
    EXPECT_EQ(strokeBounds(10.0f, 10.0f, 2.5f, 32, 1), (DirtyRect{6, 6, 14, 14}));
    EXPECT_EQ(strokeBounds(10.0f, 10.0f, 3.0f, 32, 2), (DirtyRect{5, 5, 15, 15}));
}

TEST(StrokeBoundsTest, SubPixelRadiusCoversNeighbours) {
    EXPECT_EQ(strokeBounds(10.0f, 10.0f, 0.3f, 32, 1), (DirtyRect{8, 8, 12, 12}));
}

TEST(StrokeBoundsTest, ClippedToGrid) {
    EXPECT_EQ(strokeBounds(0.0f, 0.0f, 3.0f, 16, 1), (DirtyRect{0, 0, 4, 4}));
    EXPECT_EQ(strokeBounds(15.0f, 15.0f, 3.0f, 16, 1), (DirtyRect{11, 11, 15, 15}));
    EXPECT_TRUE(strokeBounds(100.0f, 100.0f, 3.0f, 16, 1).empty());
    EXPECT_TRUE(strokeBounds(5.0f, 5.0f, 3.0f, 0, 1).empty());
}

// ============================================================================
// Raise / Lower
// ============================================================================

TEST(BrushTest, RaiseProfileOnZeroField) {
    int n = 11;
    auto height = filled(n, 0.0f);
    Brush brush{BrushKind::Raise, 3.0f, 0.5f};
    applyBrush(height, {}, n, 5.0f, 5.0f, brush);

    EXPECT_EQ(height[cellIndex(5, 5, n)], 0.5f);

    // Strictly decreasing away from the centre inside the radius
    EXPECT_LT(height[cellIndex(6, 5, n)], height[cellIndex(5, 5, n)]);
    EXPECT_LT(height[cellIndex(7, 5, n)], height[cellIndex(6, 5, n)]);
    EXPECT_GT(height[cellIndex(7, 5, n)], 0.0f);
    EXPECT_NEAR(height[cellIndex(8, 5, n)], 0.0f, 1e-6f);

    for (int y = 0; y < n; ++y) {
        for (int x = 0; x < n; ++x) {
            float dx = static_cast<float>(x - 5);
            float dy = static_cast<float>(y - 5);
            if (std::sqrt(dx * dx + dy * dy) > 3.0f) {
                EXPECT_EQ(height[cellIndex(x, y, n)], 0.0f) << x << "," << y;
            }
        }
    }
}

TEST(BrushTest, RaiseIsRadiallySymmetric) {
    int n = 21;
    auto height = filled(n, 0.2f);
    applyBrush(height, {}, n, 10.0f, 10.0f, Brush{BrushKind::Raise, 6.0f, 0.3f});
    EXPECT_EQ(height[cellIndex(13, 10, n)], height[cellIndex(7, 10, n)]);
    EXPECT_EQ(height[cellIndex(10, 13, n)], height[cellIndex(10, 7, n)]);
    EXPECT_EQ(height[cellIndex(12, 12, n)], height[cellIndex(8, 8, n)]);
}

TEST(BrushTest, RaiseThenLowerRestoresField) {
    int n = 24;
    auto height = filled(n, 0.5f);
    Brush raise{BrushKind::Raise, 5.0f, 0.1f};
    Brush lower{BrushKind::Lower, 5.0f, 0.1f};

    applyBrush(height, {}, n, 12.0f, 9.0f, raise);
    applyBrush(height, {}, n, 12.0f, 9.0f, lower);

    for (float h : height) {
        EXPECT_NEAR(h, 0.5f, 1e-6f);
    }
}

TEST(BrushTest, ClampsToUnitRange) {
    int n = 9;
    auto high = filled(n, 0.95f);
    applyBrush(high, {}, n, 4.0f, 4.0f, Brush{BrushKind::Raise, 3.0f, 1.0f});
    EXPECT_EQ(high[cellIndex(4, 4, n)], 1.0f);

    auto low = filled(n, 0.05f);
    applyBrush(low, {}, n, 4.0f, 4.0f, Brush{BrushKind::Lower, 3.0f, 1.0f});
    EXPECT_EQ(low[cellIndex(4, 4, n)], 0.0f);

    for (size_t i = 0; i < high.size(); ++i) {
        EXPECT_LE(high[i], 1.0f);
        EXPECT_GE(low[i], 0.0f);
    }
}

TEST(BrushTest, NegativeStrengthRaiseLowers) {
    int n = 9;
    auto height = filled(n, 0.5f);
    applyBrush(height, {}, n, 4.0f, 4.0f, Brush{BrushKind::Raise, 2.0f, -0.2f});
    EXPECT_FLOAT_EQ(height[cellIndex(4, 4, n)], 0.3f);
}

TEST(BrushTest, StrokeNearEdge) {
    int n = 8;
    auto height = filled(n, 0.0f);
    DirtyRect rect = applyBrush(height, {}, n, 0.0f, 0.0f, Brush{BrushKind::Raise, 3.0f, 0.4f});
    EXPECT_EQ(height[0], 0.4f);
    EXPECT_EQ(rect, (DirtyRect{0, 0, 4, 4}));
}

TEST(BrushTest, OffGridStrokeChangesNothing) {
    int n = 8;
    auto height = filled(n, 0.3f);
    auto before = height;
    DirtyRect rect = applyBrush(height, {}, n, 50.0f, -40.0f, Brush{BrushKind::Raise, 4.0f, 0.4f});
    EXPECT_TRUE(rect.empty());
    EXPECT_EQ(height, before);
}

// ============================================================================
// Smooth
// ============================================================================

TEST(BrushTest, SmoothFlattensSpike) {
    int n = 15;
    auto height = filled(n, 0.0f);
    height[cellIndex(7, 7, n)] = 1.0f;

    applyBrush(height, {}, n, 7.0f, 7.0f, Brush{BrushKind::Smooth, 2.0f, 1.0f});

    float center = height[cellIndex(7, 7, n)];
    EXPECT_LT(center, 1.0f);
    EXPECT_GT(center, 0.0f);
    EXPECT_GT(height[cellIndex(8, 7, n)], 0.0f);
    for (float h : height) {
        EXPECT_GE(h, 0.0f);
        EXPECT_LE(h, 1.0f);
        EXPECT_FALSE(std::isnan(h));
    }
}

TEST(BrushTest, SmoothHugeRadiusMatchesGridWideWindow) {
    int n = 16;
    auto reference = filled(n, 0.0f);
    generateHeightField(reference, n, 77, NoiseParams{});

    auto capped = reference;
    applyBrush(capped, {}, n, 8.0f, 8.0f, Brush{BrushKind::Smooth, static_cast<float>(n), 0.8f});

    for (float radius : {1e10f, 3e38f}) {
        auto huge = reference;
        DirtyRect rect = applyBrush(huge, {}, n, 8.0f, 8.0f, Brush{BrushKind::Smooth, radius, 0.8f});
        EXPECT_EQ(rect.x0, 0);
        EXPECT_EQ(rect.y1, n - 1);
        for (size_t i = 0; i < huge.size(); ++i) {
            ASSERT_TRUE(std::isfinite(huge[i]));
            EXPECT_EQ(huge[i], capped[i]);
        }
    }
}

TEST(BrushTest, SmoothKeepsConstantField) {
    int n = 12;
    auto height = filled(n, 0.6f);
    applyBrush(height, {}, n, 1.0f, 10.0f, Brush{BrushKind::Smooth, 4.0f, 1.0f});
    for (float h : height) {
        EXPECT_NEAR(h, 0.6f, 1e-6f);
    }
}

TEST(BrushTest, SmoothZeroStrengthIsIdentity) {
    int n = 16;
    std::vector<float> height(static_cast<size_t>(n * n));
    generateHeightField(height, n, 3, NoiseParams{});
    auto before = height;
    applyBrush(height, {}, n, 8.0f, 8.0f, Brush{BrushKind::Smooth, 3.0f, 0.0f});
    EXPECT_EQ(height, before);
}

TEST(BrushTest, SmoothAtCornerStaysFinite) {
    int n = 6;
    std::vector<float> height(static_cast<size_t>(n * n));
    generateHeightField(height, n, 8, NoiseParams{});
    applyBrush(height, {}, n, 0.0f, 0.0f, Brush{BrushKind::Smooth, 5.0f, 0.7f});
    for (float h : height) {
        EXPECT_FALSE(std::isnan(h));
        EXPECT_GE(h, 0.0f);
        EXPECT_LE(h, 1.0f);
    }
}

// ============================================================================
// Rain
// ============================================================================

TEST(BrushTest, RainWetsWithoutTouchingHeight) {
    int n = 10;
    auto height = filled(n, 0.5f);
    auto moisture = filled(n, 0.2f);
    auto heightBefore = height;

    applyBrush(height, moisture, n, 5.0f, 5.0f, Brush{BrushKind::Rain, 3.0f, 0.3f});

    EXPECT_EQ(height, heightBefore);
    EXPECT_FLOAT_EQ(moisture[cellIndex(5, 5, n)], 0.5f);
    EXPECT_EQ(moisture[cellIndex(0, 0, n)], 0.2f);
}

TEST(BrushTest, RainClampsMoisture) {
    int n = 6;
    auto height = filled(n, 0.5f);
    auto moisture = filled(n, 0.9f);
    applyBrush(height, moisture, n, 3.0f, 3.0f, Brush{BrushKind::Rain, 2.0f, 1.0f});
    EXPECT_EQ(moisture[cellIndex(3, 3, n)], 1.0f);
}

TEST(BrushTest, RainWithoutMoistureLayerIsHarmless) {
    int n = 6;
    auto height = filled(n, 0.5f);
    auto before = height;
    DirtyRect rect = applyBrush(height, {}, n, 3.0f, 3.0f, Brush{BrushKind::Rain, 2.0f, 0.5f});
    EXPECT_FALSE(rect.empty());
    EXPECT_EQ(height, before);
}

// ============================================================================
// Dirty rect containment
// ============================================================================

TEST(BrushTest, DirtyRectContainsEveryChange) {
    int n = 40;
    std::vector<float> base(static_cast<size_t>(n * n));
    generateHeightField(base, n, 21, NoiseParams{});

    struct Stroke {
        Brush brush;
        float x;
        float y;
    };
    const Stroke strokes[] = {
        {{BrushKind::Raise, 4.5f, 0.3f}, 20.3f, 11.7f},
        {{BrushKind::Lower, 7.0f, 0.2f}, 2.0f, 37.5f},
        {{BrushKind::Smooth, 3.2f, 0.8f}, 30.0f, 30.0f},
        {{BrushKind::Smooth, 6.0f, 1.0f}, 0.5f, 0.5f},
        {{BrushKind::Rain, 5.0f, 0.4f}, 15.0f, 25.0f},
        {{BrushKind::Raise, 0.4f, 0.5f}, 9.6f, 9.4f},
    };

    for (const auto& s : strokes) {
        auto height = base;
        auto moisture = filled(n, 0.3f);
        auto moistureBefore = moisture;

        DirtyRect rect = applyBrush(height, moisture, n, s.x, s.y, s.brush);
        EXPECT_FALSE(rect.empty());
        EXPECT_GE(rect.x0, 0);
        EXPECT_GE(rect.y0, 0);
        EXPECT_LT(rect.x1, n);
        EXPECT_LT(rect.y1, n);

        expectChangesInside(base, height, n, rect);
        expectChangesInside(moistureBefore, moisture, n, rect);
    }
}

// ============================================================================
// Errors
// ============================================================================

TEST(BrushTest, RejectsNonPositiveRadius) {
    auto height = filled(4, 0.5f);
    EXPECT_THROW(applyBrush(height, {}, 4, 1.0f, 1.0f, Brush{BrushKind::Raise, 0.0f, 0.1f}),
                 std::invalid_argument);
    EXPECT_THROW(applyBrush(height, {}, 4, 1.0f, 1.0f, Brush{BrushKind::Smooth, -2.0f, 0.1f}),
                 std::invalid_argument);
}

TEST(BrushTest, RejectsNonFiniteValues) {
    auto height = filled(4, 0.5f);
    float nan = std::numeric_limits<float>::quiet_NaN();
    float inf = std::numeric_limits<float>::infinity();
    EXPECT_THROW(applyBrush(height, {}, 4, 1.0f, 1.0f, Brush{BrushKind::Raise, nan, 0.1f}),
                 std::invalid_argument);
    EXPECT_THROW(applyBrush(height, {}, 4, 1.0f, 1.0f, Brush{BrushKind::Raise, 2.0f, inf}),
                 std::invalid_argument);
    EXPECT_THROW(applyBrush(height, {}, 4, nan, 1.0f, Brush{BrushKind::Raise, 2.0f, 0.1f}),
                 std::invalid_argument);
}

TEST(BrushTest, ZeroSizeIsNoOp) {
    std::vector<float> height;
    DirtyRect rect = applyBrush(height, {}, 0, 0.0f, 0.0f, Brush{});
    EXPECT_TRUE(rect.empty());
}
