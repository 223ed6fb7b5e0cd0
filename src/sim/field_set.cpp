#include "terraforge/sim/field_set.hpp"

#include <algorithm>

namespace terraforge {

void FieldSet::resize(int newSize) {
    size = std::max(0, newSize);
    size_t n = static_cast<size_t>(size) * static_cast<size_t>(size);

    // assign() rather than resize() so stale values never survive a size change
    height.assign(n, 0.0f);
    temperature.assign(n, 0.0f);
    moisture.assign(n, 0.0f);
    rivers.assign(n, 0);
    biomes.assign(n, 0);
}

bool FieldSet::consistent() const {
    size_t n = static_cast<size_t>(std::max(0, size)) * static_cast<size_t>(std::max(0, size));
    return height.size() == n && temperature.size() == n && moisture.size() == n &&
           rivers.size() == n && biomes.size() == n;
}

FieldStats summarize(const FieldSet& fields, float seaLevel) {
    FieldStats stats;
    if (!fields.consistent() || fields.cellCount() == 0) {
        return stats;
    }

    stats.cells = fields.cellCount();
    stats.minHeight = fields.height[0];
    stats.maxHeight = fields.height[0];

    double sum = 0.0;
    for (size_t i = 0; i < stats.cells; ++i) {
        float h = fields.height[i];
        stats.minHeight = std::min(stats.minHeight, h);
        stats.maxHeight = std::max(stats.maxHeight, h);
        sum += h;
        if (h > seaLevel) ++stats.landCells;
        if (fields.rivers[i]) ++stats.riverCells;
        if (fields.biomes[i] < worldgen::kBiomeCount) ++stats.biomeCounts[fields.biomes[i]];
    }
    stats.meanHeight = static_cast<float>(sum / static_cast<double>(stats.cells));
    return stats;
}

}  // namespace terraforge
