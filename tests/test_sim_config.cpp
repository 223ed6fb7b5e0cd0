/**
 * @file test_sim_config.cpp
 * @brief Tests for config-to-parameter mapping and snapshot persistence
 */

#include "terraforge/sim/sim_config.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <stdexcept>

using namespace terraforge;

class SimConfigTest : public ::testing::Test {
protected:
    ConfigParser parser;
};

// ============================================================================
// Parameters
// ============================================================================

TEST_F(SimConfigTest, EmptyDocumentGivesDefaults) {
    ConfigDocument doc;
    SimParams params = paramsFromConfig(doc);

    EXPECT_EQ(params.size, 512);
    EXPECT_EQ(params.noise.octaves, 4);
    EXPECT_FLOAT_EQ(params.noise.lacunarity, 2.0f);
    EXPECT_FLOAT_EQ(params.noise.gain, 0.5f);
    EXPECT_FLOAT_EQ(params.noise.warp, 0.1f);
    EXPECT_FLOAT_EQ(params.climate.seaLevel, 0.4f);
    EXPECT_FLOAT_EQ(params.climate.tempLapse, 0.5f);
    EXPECT_FLOAT_EQ(params.climate.moistureShift, 0.0f);
    EXPECT_FLOAT_EQ(params.riverThreshold, 0.01f);
}

TEST_F(SimConfigTest, ReadsEveryParameter) {
    auto doc = parser.parseString(
        "size: 256\n"
        "noise.octaves: 6\n"
        "noise.lacunarity: 2.2\n"
        "noise.gain: 0.45\n"
        "noise.warp: 12\n"
        "climate.sea_level: 0.35\n"
        "climate.temp_lapse: 0.7\n"
        "climate.moisture_shift: -0.1\n"
        "rivers.threshold: 0.05\n"
    );
    SimParams params = paramsFromConfig(doc);

    EXPECT_EQ(params.size, 256);
    EXPECT_EQ(params.noise.octaves, 6);
    EXPECT_FLOAT_EQ(params.noise.lacunarity, 2.2f);
    EXPECT_FLOAT_EQ(params.noise.gain, 0.45f);
    EXPECT_FLOAT_EQ(params.noise.warp, 12.0f);
    EXPECT_FLOAT_EQ(params.climate.seaLevel, 0.35f);
    EXPECT_FLOAT_EQ(params.climate.tempLapse, 0.7f);
    EXPECT_FLOAT_EQ(params.climate.moistureShift, -0.1f);
    EXPECT_FLOAT_EQ(params.riverThreshold, 0.05f);
}

TEST_F(SimConfigTest, UnparsableValueKeepsDefault) {
    auto doc = parser.parseString(
        "size: huge\n"
        "noise.gain: 0.3x\n"
        "noise.octaves: 2\n"
    );
    SimParams defaults;
    defaults.size = 64;
    SimParams params = paramsFromConfig(doc, defaults);

    EXPECT_EQ(params.size, 64);
    EXPECT_FLOAT_EQ(params.noise.gain, 0.5f);
    EXPECT_EQ(params.noise.octaves, 2);
}

TEST_F(SimConfigTest, RangeChecksAreLeftToValidation) {
    auto doc = parser.parseString("size: -4\n");
    SimParams params = paramsFromConfig(doc);

    EXPECT_EQ(params.size, -4);
    EXPECT_THROW(validateParams(params), std::invalid_argument);
}

// ============================================================================
// Generator options and brush
// ============================================================================

TEST_F(SimConfigTest, GeneratorOptions) {
    GeneratorOptions defaults = optionsFromConfig(ConfigDocument{});
    EXPECT_FLOAT_EQ(defaults.baseFrequency, 1.0f / 128.0f);
    EXPECT_FALSE(defaults.islandMask);
    EXPECT_EQ(defaults.riverDilatePasses, 0);
    EXPECT_FALSE(defaults.debugLogging);

    auto doc = parser.parseString(
        "generation.base_frequency: 0.015625\n"
        "generation.island_mask: yes\n"
        "rivers.dilate_passes: 2\n"
        "debug.logging: on\n"
    );
    GeneratorOptions options = optionsFromConfig(doc);
    EXPECT_FLOAT_EQ(options.baseFrequency, 1.0f / 64.0f);
    EXPECT_TRUE(options.islandMask);
    EXPECT_EQ(options.riverDilatePasses, 2);
    EXPECT_TRUE(options.debugLogging);
}

TEST_F(SimConfigTest, BrushSettings) {
    worldgen::Brush fallback = brushFromConfig(ConfigDocument{});
    EXPECT_EQ(fallback.kind, worldgen::BrushKind::Raise);
    EXPECT_FLOAT_EQ(fallback.radius, 5.0f);
    EXPECT_FLOAT_EQ(fallback.strength, 0.1f);

    auto doc = parser.parseString(
        "brush.kind: smooth\n"
        "brush.radius: 9.5\n"
        "brush.strength: 0.6\n"
    );
    worldgen::Brush brush = brushFromConfig(doc);
    EXPECT_EQ(brush.kind, worldgen::BrushKind::Smooth);
    EXPECT_FLOAT_EQ(brush.radius, 9.5f);
    EXPECT_FLOAT_EQ(brush.strength, 0.6f);
}

TEST_F(SimConfigTest, UnknownBrushKindKeepsDefault) {
    auto doc = parser.parseString("brush.kind: erode\n");
    EXPECT_EQ(brushFromConfig(doc).kind, worldgen::BrushKind::Raise);
}

// ============================================================================
// Snapshots
// ============================================================================

TEST_F(SimConfigTest, SnapshotDefaults) {
    Snapshot snapshot = snapshotFromConfig(ConfigDocument{});
    EXPECT_EQ(snapshot.seed, 1u);
    EXPECT_TRUE(snapshot.label.empty());
    EXPECT_EQ(snapshot.params.size, 512);
}

TEST_F(SimConfigTest, SnapshotSeedRange) {
    EXPECT_EQ(snapshotFromConfig(parser.parseString("seed: 4294967295\n")).seed, 4294967295u);
    EXPECT_EQ(snapshotFromConfig(parser.parseString("seed: 0xCAFE\n")).seed, 0xCAFEu);
    EXPECT_EQ(snapshotFromConfig(parser.parseString("seed: -1\n")).seed, 1u);
    EXPECT_EQ(snapshotFromConfig(parser.parseString("seed: 4294967296\n")).seed, 1u);
}

TEST_F(SimConfigTest, FormatRoundTrips) {
    Snapshot original;
    original.seed = 987654321u;
    original.label = "ridge study: pass 2";
    original.params.size = 300;
    original.params.noise.octaves = 7;
    original.params.noise.lacunarity = 2.137f;
    original.params.noise.gain = 0.4321f;
    original.params.noise.warp = 0.1f / 3.0f;
    original.params.climate.seaLevel = 0.41f;
    original.params.climate.tempLapse = 0.66f;
    original.params.climate.moistureShift = -0.07f;
    original.params.riverThreshold = 0.0123f;

    Snapshot loaded = snapshotFromConfig(parser.parseString(formatSnapshot(original)));

    EXPECT_EQ(loaded.seed, original.seed);
    EXPECT_EQ(loaded.label, original.label);
    EXPECT_EQ(loaded.params.size, original.params.size);
    EXPECT_EQ(loaded.params.noise.octaves, original.params.noise.octaves);
    // Bitwise equality, not just approximate
    EXPECT_EQ(loaded.params.noise.lacunarity, original.params.noise.lacunarity);
    EXPECT_EQ(loaded.params.noise.gain, original.params.noise.gain);
    EXPECT_EQ(loaded.params.noise.warp, original.params.noise.warp);
    EXPECT_EQ(loaded.params.climate.seaLevel, original.params.climate.seaLevel);
    EXPECT_EQ(loaded.params.climate.tempLapse, original.params.climate.tempLapse);
    EXPECT_EQ(loaded.params.climate.moistureShift, original.params.climate.moistureShift);
    EXPECT_EQ(loaded.params.riverThreshold, original.params.riverThreshold);
}

TEST_F(SimConfigTest, MultiLineLabelIsFlattened) {
    Snapshot original;
    original.label = "first\nsecond";
    Snapshot loaded = snapshotFromConfig(parser.parseString(formatSnapshot(original)));
    EXPECT_EQ(loaded.label, "first second");
}

TEST_F(SimConfigTest, SaveAndLoadFile) {
    auto path = std::filesystem::temp_directory_path() / "terraforge_snapshot_test.conf";

    Snapshot original;
    original.seed = 31337;
    original.label = "saved";
    original.params.size = 128;
    ASSERT_TRUE(saveSnapshot(original, path.string()));

    auto loaded = loadSnapshot(path.string());
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->seed, 31337u);
    EXPECT_EQ(loaded->label, "saved");
    EXPECT_EQ(loaded->params.size, 128);

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

TEST_F(SimConfigTest, LoadMissingFile) {
    EXPECT_FALSE(loadSnapshot("/nonexistent/terraforge/snapshot.conf").has_value());
}
