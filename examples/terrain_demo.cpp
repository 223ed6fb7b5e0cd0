/**
 * @file terrain_demo.cpp
 * @brief Headless terrain generation demo driven through ComputeService
 *
 * Demonstrates:
 * - Loading seed, params and generator options from a config file
 * - Queueing initialize plus a handful of brush edits on the worker thread
 * - Consuming progress, result and error responses by request id
 * - Field statistics (land fraction, rivers, biome histogram)
 *
 * Command line:
 *   terrain_demo [config-file]
 *
 * Without a config file the defaults are used (512x512, seed 1).
 */

#include <terraforge/core/config_parser.hpp>
#include <terraforge/core/wake_signal.hpp>
#include <terraforge/sim/compute_service.hpp>
#include <terraforge/sim/sim_config.hpp>

#include <iomanip>
#include <iostream>
#include <map>

using namespace terraforge;

namespace {

void printStats(const FieldSet& fields, float seaLevel) {
    FieldStats stats = summarize(fields, seaLevel);

    std::cout << "  " << fields.size << "x" << fields.size << " cells, height ["
              << stats.minHeight << ", " << stats.maxHeight << "], mean " << stats.meanHeight << "\n";
    std::cout << "  Land: " << std::fixed << std::setprecision(1)
              << stats.landFraction() * 100.0f << "%, river cells: " << stats.riverCells << "\n";
    std::cout << std::defaultfloat << std::setprecision(6);

    for (size_t b = 0; b < stats.biomeCounts.size(); ++b) {
        if (stats.biomeCounts[b] == 0) continue;
        std::cout << "    " << std::setw(20) << std::left
                  << worldgen::biomeName(static_cast<worldgen::Biome>(b))
                  << std::right << stats.biomeCounts[b] << "\n";
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    std::cout << "=== TerraForge Terrain Demo ===\n\n";

    ConfigDocument doc;
    if (argc > 1) {
        ConfigParser parser;
        auto parsed = parser.parseFile(argv[1]);
        if (!parsed) {
            std::cerr << "Cannot open config file: " << argv[1] << "\n";
            return 1;
        }
        doc = std::move(*parsed);
        std::cout << "Loaded " << doc.size() << " entries from " << argv[1] << "\n";
    }

    Snapshot snapshot = snapshotFromConfig(doc);
    GeneratorOptions options = optionsFromConfig(doc);
    worldgen::Brush brush = brushFromConfig(doc);

    std::cout << "Seed " << snapshot.seed << ", size " << snapshot.params.size
              << ", octaves " << snapshot.params.noise.octaves << "\n";
    if (!snapshot.label.empty()) {
        std::cout << "Label: " << snapshot.label << "\n";
    }
    std::cout << "\n";

    WakeSignal ready;
    ComputeService service(options);
    service.attachConsumer(&ready);
    service.start();

    std::map<uint64_t, std::string> names;
    names[service.submit(InitializeRequest{snapshot.seed, snapshot.params})] = "initialize";

    // A short stroke across the middle of the map, then one stroke per other kind
    int n = snapshot.params.size;
    for (int i = 0; i < 5; ++i) {
        int x = n / 4 + i * n / 10;
        names[service.submit(EditRequest{x, n / 2, brush})] =
            std::string(worldgen::brushKindName(brush.kind)) + " stroke";
    }
    for (auto kind : {worldgen::BrushKind::Smooth, worldgen::BrushKind::Rain, worldgen::BrushKind::Lower}) {
        worldgen::Brush extra = brush;
        extra.kind = kind;
        names[service.submit(EditRequest{n / 2, n / 3, extra})] = std::string(worldgen::brushKindName(kind));
    }

    size_t remaining = names.size();
    std::shared_ptr<const FieldSet> latest;

    while (remaining > 0 && ready.wait()) {
        for (auto& event : service.drainEvents()) {
            const std::string& name = names[event.requestId];

            if (auto* progress = std::get_if<ProgressResponse>(&event.response)) {
                std::cout << "[" << event.requestId << " " << name << "] "
                          << phaseName(progress->phase) << " "
                          << static_cast<int>(progress->fraction * 100.0f) << "%\n";
            } else if (auto* result = std::get_if<ResultResponse>(&event.response)) {
                std::cout << "[" << event.requestId << " " << name << "] done\n";
                latest = result->fields;
                --remaining;
            } else if (auto* error = std::get_if<ErrorResponse>(&event.response)) {
                std::cout << "[" << event.requestId << " " << name << "] error: " << error->message << "\n";
                --remaining;
            }
        }
    }

    service.stop();

    if (latest) {
        std::cout << "\nFinal terrain:\n";
        printStats(*latest, snapshot.params.climate.seaLevel);
    }

    std::cout << "\nSnapshot:\n" << formatSnapshot(snapshot);
    return latest ? 0 : 1;
}
