#include "terraforge/sim/sim_config.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>

namespace terraforge {

namespace {

void warnUnparsable(const ConfigEntry& entry, const char* expected) {
    std::cerr << "[SimConfig] WARNING: line " << entry.line << ": '" << entry.key
              << "' expects " << expected << ", got '" << entry.value.asString()
              << "'; keeping default\n";
}

void readFloat(const ConfigDocument& doc, std::string_view key, float& out) {
    const ConfigEntry* entry = doc.get(key);
    if (!entry) return;
    if (auto v = entry->value.tryDouble()) {
        out = static_cast<float>(*v);
    } else {
        warnUnparsable(*entry, "a number");
    }
}

void readInt(const ConfigDocument& doc, std::string_view key, int& out) {
    const ConfigEntry* entry = doc.get(key);
    if (!entry) return;
    auto v = entry->value.tryInteger();
    if (v && *v >= std::numeric_limits<int>::min() && *v <= std::numeric_limits<int>::max()) {
        out = static_cast<int>(*v);
    } else {
        warnUnparsable(*entry, "an integer");
    }
}

void readBool(const ConfigDocument& doc, std::string_view key, bool& out) {
    const ConfigEntry* entry = doc.get(key);
    if (!entry) return;
    if (auto v = entry->value.tryBool()) {
        out = *v;
    } else {
        warnUnparsable(*entry, "true or false");
    }
}

}  // namespace

SimParams paramsFromConfig(const ConfigDocument& doc, const SimParams& defaults) {
    SimParams params = defaults;
    readInt(doc, "size", params.size);
    readInt(doc, "noise.octaves", params.noise.octaves);
    readFloat(doc, "noise.lacunarity", params.noise.lacunarity);
    readFloat(doc, "noise.gain", params.noise.gain);
    readFloat(doc, "noise.warp", params.noise.warp);
    readFloat(doc, "climate.sea_level", params.climate.seaLevel);
    readFloat(doc, "climate.temp_lapse", params.climate.tempLapse);
    readFloat(doc, "climate.moisture_shift", params.climate.moistureShift);
    readFloat(doc, "rivers.threshold", params.riverThreshold);
    return params;
}

GeneratorOptions optionsFromConfig(const ConfigDocument& doc, const GeneratorOptions& defaults) {
    GeneratorOptions options = defaults;
    readFloat(doc, "generation.base_frequency", options.baseFrequency);
    readBool(doc, "generation.island_mask", options.islandMask);
    readInt(doc, "rivers.dilate_passes", options.riverDilatePasses);
    readBool(doc, "debug.logging", options.debugLogging);
    return options;
}

worldgen::Brush brushFromConfig(const ConfigDocument& doc, const worldgen::Brush& defaults) {
    worldgen::Brush brush = defaults;
    if (const ConfigEntry* entry = doc.get("brush.kind")) {
        if (auto kind = worldgen::parseBrushKind(entry->value.asString())) {
            brush.kind = *kind;
        } else {
            warnUnparsable(*entry, "raise, lower, smooth or rain");
        }
    }
    readFloat(doc, "brush.radius", brush.radius);
    readFloat(doc, "brush.strength", brush.strength);
    return brush;
}

Snapshot snapshotFromConfig(const ConfigDocument& doc) {
    Snapshot snapshot;
    if (const ConfigEntry* entry = doc.get("seed")) {
        auto v = entry->value.tryInteger();
        if (v && *v >= 0 && *v <= static_cast<long long>(std::numeric_limits<uint32_t>::max())) {
            snapshot.seed = static_cast<uint32_t>(*v);
        } else {
            warnUnparsable(*entry, "an unsigned 32-bit integer");
        }
    }
    snapshot.label = std::string(doc.getString("label"));
    snapshot.params = paramsFromConfig(doc);
    return snapshot;
}

std::string formatSnapshot(const Snapshot& snapshot) {
    const SimParams& p = snapshot.params;

    // Newlines would split the label across config lines
    std::string label = snapshot.label;
    for (char& c : label) {
        if (c == '\n' || c == '\r') c = ' ';
    }

    std::ostringstream out;
    out << std::setprecision(9);
    out << "# terraforge snapshot\n";
    out << "seed: " << snapshot.seed << "\n";
    if (!label.empty()) {
        out << "label: " << label << "\n";
    }
    out << "size: " << p.size << "\n";
    out << "noise.octaves: " << p.noise.octaves << "\n";
    out << "noise.lacunarity: " << p.noise.lacunarity << "\n";
    out << "noise.gain: " << p.noise.gain << "\n";
    out << "noise.warp: " << p.noise.warp << "\n";
    out << "climate.sea_level: " << p.climate.seaLevel << "\n";
    out << "climate.temp_lapse: " << p.climate.tempLapse << "\n";
    out << "climate.moisture_shift: " << p.climate.moistureShift << "\n";
    out << "rivers.threshold: " << p.riverThreshold << "\n";
    return out.str();
}

std::optional<Snapshot> loadSnapshot(const std::string& path) {
    ConfigParser parser;
    auto doc = parser.parseFile(path);
    if (!doc) {
        return std::nullopt;
    }
    return snapshotFromConfig(*doc);
}

bool saveSnapshot(const Snapshot& snapshot, const std::string& path) {
    std::ofstream file(path);
    if (!file) {
        std::cerr << "[SimConfig] Cannot write snapshot to " << path << "\n";
        return false;
    }
    file << formatSnapshot(snapshot);
    return static_cast<bool>(file);
}

}  // namespace terraforge
