/**
 * @file noise.hpp
 * @brief Deterministic hashing, seeded streams and gradient noise
 *
 * All randomness in world generation comes from this header: stage seeds are
 * derived with NoiseHash::deriveSeed, draws come from a SeedStream, and
 * coherent terrain noise comes from PerlinNoise2D. Same seed + coordinates
 * = same output on every platform.
 */

#pragma once

#include <array>
#include <cstdint>

namespace tectogen::worldgen {

// ============================================================================
// Seed utilities
// ============================================================================

/// Deterministic hash and seed derivation
class NoiseHash {
public:
    /// Hash a 2D integer position with a seed
    [[nodiscard]] static uint32_t hash2D(int32_t x, int32_t y, uint64_t seed);

    /// Derive an independent sub-seed from a base seed and salt
    [[nodiscard]] static uint64_t deriveSeed(uint64_t baseSeed, uint64_t salt);

    /// Map a hash to [0, 1)
    [[nodiscard]] static float toUnitFloat(uint32_t hash);
};

/**
 * @brief SplitMix64 pseudo-random stream
 *
 * Every draw is defined bit-for-bit here, so sequences never depend on a
 * standard library's distribution implementation.
 */
class SeedStream {
public:
    explicit SeedStream(uint64_t seed) : state_(seed) {}

    /// Stream for entity `index` of a stage (seed -> stage -> entity)
    [[nodiscard]] static SeedStream forEntity(uint64_t seed, uint64_t stage, uint64_t index);

    [[nodiscard]] uint64_t nextU64();

    /// Uniform in [0, 1), 24 bits of precision
    [[nodiscard]] float nextFloat();

    /// Uniform in [0, 1), 53 bits of precision
    [[nodiscard]] double nextDouble();

    /// Uniform in [0, bound). Throws std::invalid_argument if bound <= 0.
    [[nodiscard]] int32_t nextInt(int32_t bound);

    /// Uniform in [lo, hi)
    [[nodiscard]] float nextRange(float lo, float hi);

private:
    uint64_t state_;
};

// ============================================================================
// Base interface
// ============================================================================

/// Abstract 2D noise evaluator
class Noise2D {
public:
    virtual ~Noise2D() = default;

    /// Evaluate noise at (x, y). Returns approximately [-1, 1].
    [[nodiscard]] virtual float evaluate(float x, float y) const = 0;
};

// ============================================================================
// Perlin noise
// ============================================================================

/// Improved Perlin gradient noise (2D)
class PerlinNoise2D : public Noise2D {
public:
    explicit PerlinNoise2D(uint64_t seed);

    [[nodiscard]] float evaluate(float x, float y) const override;

private:
    std::array<uint8_t, 512> perm_;

    void buildPermutation(uint64_t seed);
    [[nodiscard]] float grad(int hash, float x, float y) const;
};

}  // namespace tectogen::worldgen
