#pragma once

/**
 * @file sim_config.hpp
 * @brief Mapping between config documents and simulation types
 *
 * Recognised keys:
 * ```
 * seed: 42
 * label: coastline study
 * size: 512
 * noise.octaves: 4
 * noise.lacunarity: 2
 * noise.gain: 0.5
 * noise.warp: 0.1
 * climate.sea_level: 0.4
 * climate.temp_lapse: 0.5
 * climate.moisture_shift: 0
 * rivers.threshold: 0.01
 * rivers.dilate_passes: 0
 * generation.base_frequency: 0.0078125
 * generation.island_mask: false
 * debug.logging: false
 * brush.kind: raise
 * brush.radius: 5
 * brush.strength: 0.1
 * ```
 *
 * Missing keys keep the supplied defaults. A present key whose value does not
 * parse is reported on std::cerr and also keeps its default. Range checks are
 * left to validateParams() so the orchestrator reports them per request.
 */

#include "terraforge/core/config_parser.hpp"
#include "terraforge/sim/sim_params.hpp"
#include "terraforge/worldgen/brush.hpp"

#include <optional>
#include <string>

namespace terraforge {

[[nodiscard]] SimParams paramsFromConfig(const ConfigDocument& doc, const SimParams& defaults = {});

[[nodiscard]] GeneratorOptions optionsFromConfig(const ConfigDocument& doc,
                                                 const GeneratorOptions& defaults = {});

[[nodiscard]] worldgen::Brush brushFromConfig(const ConfigDocument& doc,
                                              const worldgen::Brush& defaults = {});

/// Seed (default 1), label and params
[[nodiscard]] Snapshot snapshotFromConfig(const ConfigDocument& doc);

/**
 * @brief Config text that snapshotFromConfig() reads back to an equal Snapshot
 *
 * Floats are written with 9 significant digits so they round-trip exactly.
 */
[[nodiscard]] std::string formatSnapshot(const Snapshot& snapshot);

/// nullopt if the file cannot be read
[[nodiscard]] std::optional<Snapshot> loadSnapshot(const std::string& path);

/// @return false if the file cannot be written
bool saveSnapshot(const Snapshot& snapshot, const std::string& path);

}  // namespace terraforge
