/**
 * @file random.cpp
 * @brief Permutation table construction
 */

#include "terraforge/worldgen/random.hpp"

#include <cmath>
#include <utility>

namespace terraforge::worldgen {

PermutationTable::PermutationTable(uint32_t seed) {
    XorShift32 rng(seed);

    for (int i = 0; i < 256; ++i) {
        perm_[static_cast<size_t>(i)] = static_cast<uint8_t>(i);
    }

    // Fisher-Yates, drawing j uniformly from [0, i]
    for (int i = 255; i > 0; --i) {
        auto j = static_cast<size_t>(std::floor(rng.nextUnit() * static_cast<double>(i + 1)));
        std::swap(perm_[static_cast<size_t>(i)], perm_[j]);
    }

    for (size_t i = 0; i < 256; ++i) {
        perm_[i + 256] = perm_[i];
    }
}

}  // namespace terraforge::worldgen
