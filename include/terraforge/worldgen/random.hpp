#pragma once

/**
 * @file random.hpp
 * @brief Seeded xorshift generator and lattice permutation table
 *
 * Same seed = same stream = same permutation, on every platform.
 */

#include <array>
#include <cstddef>
#include <cstdint>

namespace terraforge::worldgen {

/// 32-bit xorshift (13, 17, 5). A zero seed is forced to 1.
class XorShift32 {
public:
    explicit XorShift32(uint32_t seed) : state_(seed != 0 ? seed : 1u) {}

    /// Next raw 32-bit state
    uint32_t nextU32() {
        state_ ^= state_ << 13;
        state_ ^= state_ >> 17;
        state_ ^= state_ << 5;
        return state_;
    }

    /// Uniform value in [0, 1)
    double nextUnit() {
        return static_cast<double>(nextU32()) / 4294967296.0;
    }

    [[nodiscard]] uint32_t state() const { return state_; }

private:
    uint32_t state_;
};

/**
 * @brief Fisher-Yates shuffled 0..255, duplicated to 512 entries
 *
 * The duplicate half lets `perm[perm[x] + y]` style lookups skip a wrap.
 */
class PermutationTable {
public:
    explicit PermutationTable(uint32_t seed);

    [[nodiscard]] uint8_t operator[](size_t i) const { return perm_[i]; }

    /// Hash an integer lattice point to 0..255 (any int, negative included)
    [[nodiscard]] uint8_t hash(int32_t ix, int32_t iy) const {
        uint32_t a = static_cast<uint32_t>(perm_[static_cast<uint32_t>(ix) & 255u]);
        return perm_[(a + static_cast<uint32_t>(iy)) & 255u];
    }

    [[nodiscard]] const std::array<uint8_t, 512>& table() const { return perm_; }

private:
    std::array<uint8_t, 512> perm_;
};

}  // namespace terraforge::worldgen
